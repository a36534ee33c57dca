#pragma once

#include "db.hpp"
#include "log.hpp"
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <stdexcept>
#include <string>

namespace tether {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// {
//   "database": { "path": "inventory.db", "foreign_keys": true, "busy_timeout_ms": 5000 },
//   "log_level": "info"
// }
struct configuration {
    std::string path = ":memory:";
    bool foreign_keys = true;
    int busy_timeout_ms = 5000;
    log_level level = log_level::off;

    /// Missing keys keep their defaults, unknown keys are ignored
    static configuration from_json(const nlohmann::json& j);
};

configuration load_configuration(const std::string& file);

/// Open the configured database and apply its connection settings
std::shared_ptr<database> open_database(const configuration& config);

} // namespace tether

#include "tether/configuration.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace tether {

using json = nlohmann::json;

configuration configuration::from_json(const json& j) {
    configuration config;
    if (!j.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    try {
        if (auto db = j.find("database"); db != j.end()) {
            if (!db->is_object()) {
                throw config_error("\"database\" must be an object");
            }
            if (auto it = db->find("path"); it != db->end()) {
                config.path = it->get<std::string>();
            }
            if (auto it = db->find("foreign_keys"); it != db->end()) {
                config.foreign_keys = it->get<bool>();
            }
            if (auto it = db->find("busy_timeout_ms"); it != db->end()) {
                config.busy_timeout_ms = it->get<int>();
            }
        }

        if (auto it = j.find("log_level"); it != j.end()) {
            auto name = it->get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                throw config_error("Unknown log level: " + name);
            }
            config.level = *level;
        }
    } catch (const json::type_error& e) {
        throw config_error(std::string("Malformed configuration: ") + e.what());
    }
    return config;
}

configuration load_configuration(const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        throw config_error("Cannot open configuration file " + file);
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw config_error("Cannot parse " + file + ": " + e.what());
    }
    return configuration::from_json(j);
}

std::shared_ptr<database> open_database(const configuration& config) {
    auto db = std::make_shared<database>(config.path);
    db->set_foreign_keys(config.foreign_keys);
    db->set_busy_timeout(config.busy_timeout_ms);
    LOG_INFO("config", "Opened %s (foreign keys %s)", config.path.c_str(),
             config.foreign_keys ? "on" : "off");
    return db;
}

} // namespace tether

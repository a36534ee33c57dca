#include "tether/log.hpp"

#include <algorithm>
#include <cctype>

namespace tether {

std::atomic<log_level> g_log_level{log_level::off};

std::optional<log_level> parse_log_level(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "off") return log_level::off;
    if (lowered == "error") return log_level::error;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "info") return log_level::info;
    if (lowered == "debug") return log_level::debug;
    return std::nullopt;
}

} // namespace tether

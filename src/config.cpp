#include "argot/config.hpp"

#include <cstdlib>

#include "argot/utils.hpp"

namespace argot {

std::optional<bool> parseBooleanOverride(const char* value) {
    if (value == nullptr) return std::nullopt;
    const auto t = utils::trimWs(value);
    if (t.empty()) return true;
    if (utils::equalsIgnoreCase(t, "true")) return true;
    if (utils::equalsIgnoreCase(t, "false")) return false;
    return std::nullopt;
}

ProcessConfig ProcessConfig::fromEnvironment() {
    ProcessConfig cfg;
    cfg.useSimplifiedAtFiles = parseBooleanOverride(std::getenv("ARGOT_USE_SIMPLIFIED_AT_FILES"));
    cfg.trimQuotes = parseBooleanOverride(std::getenv("ARGOT_TRIM_QUOTES"));
    if (const char* trace = std::getenv("ARGOT_TRACE")) {
        if (const auto level = parseTraceLevel(trace)) cfg.traceLevel = *level;
    }
    if (const char* label = std::getenv("ARGOT_AT_FILE_LABEL")) cfg.atFileLabel = std::string(label);
    if (const char* desc = std::getenv("ARGOT_AT_FILE_DESCRIPTION")) cfg.atFileDescription = std::string(desc);
    return cfg;
}

} // namespace argot

// Runtime policy helpers for engine diagnostics (environment driven).
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace duopane {

// Trimmed, lower-cased value of an environment variable ("" when unset).
inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool envFlagDisabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "0" || v == "false" || v == "no" || v == "off";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("DUOPANE_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Debug output of the job categories: on in dev environments unless
// DUOPANE_LOG_VERBOSE turns it off, and on anywhere when it turns it on.
inline bool verboseLoggingEnabled() {
    if (envFlagEnabled("DUOPANE_LOG_VERBOSE"))
        return true;
    if (envFlagDisabled("DUOPANE_LOG_VERBOSE"))
        return false;
    return isDevEnvironment();
}

} // namespace duopane

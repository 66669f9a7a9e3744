// Runtime policy helpers for diagnostics/sensitive logging.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace ferry {

// Lower-cased, trimmed value of an environment variable ("" when unset).
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

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("FERRY_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Usernames and full paths only reach the logs when this is true.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("FERRY_LOG_SENSITIVE");
}

// "host:port:user" -> "host:port:***" unless sensitive logging is on.
inline std::string loggableEndpoint(const std::string &key) {
    if (sensitiveLoggingEnabled())
        return key;
    const std::size_t cut = key.rfind(':');
    if (cut == std::string::npos)
        return key;
    return key.substr(0, cut + 1) + "***";
}

// Full path when sensitive logging is on, otherwise just the last component.
inline std::string loggablePath(const std::string &path) {
    if (sensitiveLoggingEnabled())
        return path;
    std::string trimmed = path;
    while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\'))
        trimmed.pop_back();
    const std::size_t cut = trimmed.find_last_of("/\\");
    if (cut == std::string::npos)
        return trimmed;
    return trimmed.substr(cut + 1);
}

} // namespace ferry

// Runtime policy for diagnostics: which environment we run in and whether
// paths and host names may appear in logs.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace scpbridge {

// Value of an environment variable, trimmed and lowercased. Empty when unset.
inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string v(raw);
    const auto notSpace = [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    };
    std::size_t b = 0;
    while (b < v.size() && !notSpace(v[b]))
        ++b;
    std::size_t e = v.size();
    while (e > b && !notSpace(v[e - 1]))
        --e;
    std::string out;
    out.reserve(e - b);
    for (std::size_t i = b; i < e; ++i)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(v[i]))));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// SCPBRIDGE_ENV=dev|development|local|debug
inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("SCPBRIDGE_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Needs both a dev environment and SCPBRIDGE_LOG_SENSITIVE.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("SCPBRIDGE_LOG_SENSITIVE");
}

// Value as-is when sensitive logging is enabled, a placeholder otherwise.
inline std::string redactForLog(const std::string &value) {
    if (value.empty() || sensitiveLoggingEnabled())
        return value;
    return "<redacted>";
}

} // namespace scpbridge

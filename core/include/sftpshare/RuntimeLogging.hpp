// Environment-driven runtime policy: which values may reach the logs, plus
// the env lookups shared by the settings layer and the integration tests.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace sftpshare {

// Raw value of an environment variable; nullopt when unset or empty.
inline std::optional<std::string> envValue(const char *name) {
    if (!name)
        return std::nullopt;
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

// Trimmed, lower-cased value (empty when unset).
inline std::string normalizedEnv(const char *name) {
    std::string out = envValue(name).value_or(std::string());
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(),
              out.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("SFTPSHARE_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Host, user and local paths are only logged in a dev environment with
// SFTPSHARE_LOG_SENSITIVE set. Credentials are never logged.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("SFTPSHARE_LOG_SENSITIVE");
}

inline std::string redacted(const std::string &value) {
    return sensitiveLoggingEnabled() ? value : std::string("<redacted>");
}

} // namespace sftpshare

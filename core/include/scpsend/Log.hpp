// Core diagnostics: printf-style macros on stderr, switched on by environment
// flags. Hosts and usernames go through redacted(); secrets are never logged.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace scpsend {

// Trimmed, lower-cased value of an environment variable ("" when unset).
inline std::string envValueLower(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    const char *ws = " \t\r\n";
    const auto first = v.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    v = v.substr(first, v.find_last_not_of(ws) - first + 1);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = envValueLower(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// SCPSEND_ENV=dev|development|local|debug
inline bool isDevEnvironment() {
    const std::string v = envValueLower("SCPSEND_ENV");
    return v == "dev" || v == "development" || v == "local" || v == "debug";
}

// Identifiers in logs need both a dev environment and SCPSEND_LOG_SENSITIVE.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("SCPSEND_LOG_SENSITIVE");
}

inline std::string redacted(const std::string &value) {
    if (value.empty() || sensitiveLoggingEnabled())
        return value;
    return "<redacted>";
}

inline bool logEnabled() {
    return envFlagEnabled("SCPSEND_LOG") || isDevEnvironment();
}

inline void logf(const char *level, const char *fmt, ...) {
    std::fprintf(stderr, "[scpsend][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
}

} // namespace scpsend

#define SCPSEND_LOG_AT(level, fmt, ...)                                        \
    do {                                                                       \
        if (scpsend::logEnabled())                                             \
            scpsend::logf(level, fmt, ##__VA_ARGS__);                          \
    } while (0)

#define SCPSEND_LOGD(fmt, ...) SCPSEND_LOG_AT("DEBUG", fmt, ##__VA_ARGS__)
#define SCPSEND_LOGI(fmt, ...) SCPSEND_LOG_AT("INFO", fmt, ##__VA_ARGS__)
#define SCPSEND_LOGE(fmt, ...) SCPSEND_LOG_AT("ERROR", fmt, ##__VA_ARGS__)

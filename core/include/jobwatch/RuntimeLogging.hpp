// Runtime policy helpers for diagnostics/sensitive logging.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace jobwatch {

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
    const std::string env = normalizedEnv("JOBWATCH_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("JOBWATCH_LOG_SENSITIVE");
}

// Value safe to log: the secret itself when sensitive logging is on,
// otherwise only its last `keep` characters.
inline std::string redacted(const std::string &secret, std::size_t keep = 0) {
    if (sensitiveLoggingEnabled())
        return secret;
    if (keep == 0 || secret.size() <= keep)
        return "***";
    return "***" + secret.substr(secret.size() - keep);
}

} // namespace jobwatch

#pragma once
// Store configuration
//
// Everything process-wide lives here and is handed to the Store at
// construction. Environment variables only feed from_env(); nothing reads
// them behind the store's back.

#include "log.hpp"
#include "types.hpp"
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>

namespace bridge {

// Longest lock anyone may take: ten years
constexpr int64_t MAX_LOCK_TTL_SECONDS = 10LL * 365 * 24 * 3600;

struct StoreConfig {
    std::string path;                           // SQLite file, or ":memory:"
    int64_t default_lock_ttl_seconds = 1800;    // 30 minutes
    int default_recall_limit = 5;
    bool strict_recipients = true;              // send() rejects unknown recipients
    int busy_timeout_ms = 10000;                // wait on other writers
    std::function<Timestamp()> clock = now;

    static StoreConfig from_env();
};

inline std::string default_db_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.agent-bridge/bridge.db";
}

inline bool parse_bool(const std::string& s, bool fallback) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return fallback;
}

// BRIDGE_DB_PATH, BRIDGE_LOCK_TTL, BRIDGE_STRICT_RECIPIENTS
inline StoreConfig StoreConfig::from_env() {
    StoreConfig config;
    config.path = default_db_path();

    if (const char* env_path = std::getenv("BRIDGE_DB_PATH")) {
        if (*env_path) config.path = env_path;
    }
    if (const char* env_ttl = std::getenv("BRIDGE_LOCK_TTL")) {
        char* end = nullptr;
        long long ttl = std::strtoll(env_ttl, &end, 10);
        if (end != env_ttl && *end == '\0' && ttl > 0 && ttl <= MAX_LOCK_TTL_SECONDS) {
            config.default_lock_ttl_seconds = ttl;
        } else {
            log_warn("config", "ignoring BRIDGE_LOCK_TTL=%s (want 1..%lld seconds)",
                     env_ttl, static_cast<long long>(MAX_LOCK_TTL_SECONDS));
        }
    }
    if (const char* env_strict = std::getenv("BRIDGE_STRICT_RECIPIENTS")) {
        config.strict_recipients = parse_bool(env_strict, config.strict_recipients);
    }
    return config;
}

} // namespace bridge

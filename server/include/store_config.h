#pragma once
#include <cstdint>
#include <string>

namespace plshare {

struct StoreConfig {
    std::string data_dir;              // store root (links/, blobs/)
    std::string audit_dir;             // audit JSONL + state file
    std::uint64_t soft_limit_bytes = 0; // 0 => quota disabled
    std::int64_t quota_cache_ttl_ms = 0;

    std::string listen_host = "127.0.0.1";
    int listen_port = 8090;
    std::string public_origin;         // "" => derived from request headers

    std::string settings_path;         // "" => no settings file
    std::string audit_min_level = "INFO";
    int create_rate_per_hour = 20;
    int write_rate_per_minute = 120;

    std::string audit_jsonl_path() const { return audit_dir + "/plshare_audit.jsonl"; }
    std::string audit_state_path() const { return audit_dir + "/plshare_audit.state"; }
};

// Defaults, then the settings JSON (PLSHARE_SETTINGS_PATH), then PLSHARE_*
// environment variables. Paths are made absolute.
// Returns false on a malformed settings file or invalid value.
bool load_store_config(StoreConfig* out, std::string* err);

} // namespace plshare

// tests/config/test_store_config.cpp
//
// Startup configuration: defaults, settings file, PLSHARE_* overrides.

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <sodium.h>

#include "plshare_util.h"
#include "store_config.h"

namespace fs = std::filesystem;
using namespace plshare;

static int failures = 0;

static void check(bool cond, const char* name, const std::string& detail = "") {
    if (cond) {
        std::printf("[%s] OK\n", name);
    } else {
        std::fprintf(stderr, "[%s] FAIL %s\n", name, detail.c_str());
        failures++;
    }
}

static const char* kVars[] = {
    "PLSHARE_SETTINGS_PATH", "PLSHARE_DATA_DIR", "PLSHARE_AUDIT_DIR", "PLSHARE_SOFT_LIMIT_BYTES",
    "PLSHARE_QUOTA_CACHE_TTL_MS", "PLSHARE_LISTEN_HOST", "PLSHARE_LISTEN_PORT", "PLSHARE_PUBLIC_ORIGIN",
};

static void clear_env() {
    for (const char* v : kVars) ::unsetenv(v);
}

static void spit(const fs::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::trunc);
    f << s;
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 1;
    }

    const fs::path dir = fs::temp_directory_path() / ("plshare_config_" + random_b64url(6));
    fs::create_directories(dir);
    std::string err;

    // --- defaults ---
    clear_env();
    {
        StoreConfig c;
        check(load_store_config(&c, &err), "defaults_load", err);
        const fs::path cwd = fs::current_path();
        check(c.data_dir == (cwd / "data" / "playlist-shares").lexically_normal().string(), "default_data_dir", c.data_dir);
        check(c.audit_dir == (cwd / "data" / "playlist-share-audit").lexically_normal().string(), "default_audit_dir",
              c.audit_dir);
        check(c.soft_limit_bytes == 0 && c.quota_cache_ttl_ms == 0, "default_quota_off");
        check(c.listen_host == "127.0.0.1" && c.listen_port == 8090, "default_listen");
        check(c.create_rate_per_hour == 20 && c.write_rate_per_minute == 120, "default_rates");
        check(c.audit_min_level == "INFO" && c.public_origin.empty(), "default_misc");
        check(c.audit_jsonl_path() == c.audit_dir + "/plshare_audit.jsonl", "audit_jsonl_path");
    }

    // --- environment ---
    clear_env();
    ::setenv("PLSHARE_DATA_DIR", (dir / "shares").c_str(), 1);
    ::setenv("PLSHARE_SOFT_LIMIT_BYTES", "5000000", 1);
    ::setenv("PLSHARE_QUOTA_CACHE_TTL_MS", "2500", 1);
    ::setenv("PLSHARE_LISTEN_PORT", "9191", 1);
    ::setenv("PLSHARE_PUBLIC_ORIGIN", "https://music.example/", 1);
    {
        StoreConfig c;
        check(load_store_config(&c, &err), "env_load", err);
        check(c.data_dir == (dir / "shares").string(), "env_data_dir", c.data_dir);
        check(c.audit_dir == (dir / "playlist-share-audit").string(), "env_audit_dir_follows_data", c.audit_dir);
        check(c.soft_limit_bytes == 5000000ull && c.quota_cache_ttl_ms == 2500, "env_quota");
        check(c.listen_port == 9191, "env_port");
        check(c.public_origin == "https://music.example", "env_origin_trailing_slash");
    }

    ::setenv("PLSHARE_SOFT_LIMIT_BYTES", "lots", 1);
    {
        StoreConfig c;
        check(load_store_config(&c, &err) && c.soft_limit_bytes == 0, "env_bad_limit_disables");
    }

    ::setenv("PLSHARE_LISTEN_PORT", "70000", 1);
    {
        StoreConfig c;
        check(!load_store_config(&c, &err), "env_bad_port_rejected");
    }
    ::unsetenv("PLSHARE_LISTEN_PORT");

    // --- settings file ---
    const fs::path settings = dir / "settings.json";
    ::setenv("PLSHARE_SETTINGS_PATH", settings.c_str(), 1);
    spit(settings, R"({"audit_min_level":"SECURITY","create_rate_per_hour":5,"write_rate_per_minute":30,"quota_cache_ttl_ms":100})");
    ::setenv("PLSHARE_QUOTA_CACHE_TTL_MS", "700", 1);
    {
        StoreConfig c;
        check(load_store_config(&c, &err), "settings_load", err);
        check(c.audit_min_level == "SECURITY", "settings_audit_level");
        check(c.create_rate_per_hour == 5 && c.write_rate_per_minute == 30, "settings_rates");
        check(c.quota_cache_ttl_ms == 700, "env_overrides_settings");
    }

    spit(settings, R"({"create_rate_per_hour":0})");
    {
        StoreConfig c;
        check(!load_store_config(&c, &err), "settings_bad_rate_rejected");
    }
    spit(settings, R"({"audit_min_level":"LOUD"})");
    {
        StoreConfig c;
        check(!load_store_config(&c, &err), "settings_bad_level_rejected");
    }
    spit(settings, "{ broken");
    {
        StoreConfig c;
        check(!load_store_config(&c, &err), "settings_malformed_rejected");
    }
    fs::remove(settings);
    {
        StoreConfig c;
        check(!load_store_config(&c, &err), "settings_missing_rejected");
    }

    clear_env();
    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failures) {
        std::fprintf(stderr, "[store_config] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[store_config] ALL OK\n");
    return 0;
}

#include "store_config.h"

#include "audit_log.h"
#include "plshare_util.h"
#include "share_quota.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace plshare {

static const char* kDefaultRelativeDataDir = "data/playlist-shares";

static std::string env_trimmed(const char* name) {
    const char* v = std::getenv(name);
    return v ? trim_ascii(v) : std::string();
}

static bool parse_int64(const std::string& s, std::int64_t* out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *out = (std::int64_t)v;
    return true;
}

static bool positive_int_setting(const json& j, const char* key, int* out, std::string* err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_number_integer() || it->get<long long>() <= 0 || it->get<long long>() > 1000000) {
        if (err) *err = std::string("settings: ") + key + " must be a positive integer";
        return false;
    }
    *out = it->get<int>();
    return true;
}

static bool apply_settings_file(const std::string& path, StoreConfig* c, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) {
        if (err) *err = "settings: cannot open " + path;
        return false;
    }

    json j;
    try {
        j = json::parse(f, nullptr, true);
    } catch (const std::exception& e) {
        if (err) *err = std::string("settings: parse failed for ") + path + ": " + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "settings: top level must be an object";
        return false;
    }

    auto lvl = j.find("audit_min_level");
    if (lvl != j.end() && !lvl->is_null()) {
        if (!lvl->is_string() || !parse_audit_level(lvl->get<std::string>(), nullptr)) {
            if (err) *err = "settings: audit_min_level must be DEBUG, INFO or SECURITY";
            return false;
        }
        c->audit_min_level = lvl->get<std::string>();
    }

    if (!positive_int_setting(j, "create_rate_per_hour", &c->create_rate_per_hour, err)) return false;
    if (!positive_int_setting(j, "write_rate_per_minute", &c->write_rate_per_minute, err)) return false;

    auto ttl = j.find("quota_cache_ttl_ms");
    if (ttl != j.end() && !ttl->is_null()) {
        if (!ttl->is_number_integer() || ttl->get<long long>() < 0) {
            if (err) *err = "settings: quota_cache_ttl_ms must be a non-negative integer";
            return false;
        }
        c->quota_cache_ttl_ms = ttl->get<std::int64_t>();
    }
    return true;
}

bool load_store_config(StoreConfig* out, std::string* err) {
    if (!out) return false;
    StoreConfig c;

    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        if (err) *err = "cannot determine working directory: " + ec.message();
        return false;
    }

    c.settings_path = env_trimmed("PLSHARE_SETTINGS_PATH");
    if (!c.settings_path.empty() && !apply_settings_file(c.settings_path, &c, err)) return false;

    std::string v = env_trimmed("PLSHARE_DATA_DIR");
    std::filesystem::path data_dir = v.empty() ? (cwd / kDefaultRelativeDataDir) : std::filesystem::path(v);
    if (data_dir.is_relative()) data_dir = cwd / data_dir;
    c.data_dir = data_dir.lexically_normal().string();

    v = env_trimmed("PLSHARE_AUDIT_DIR");
    std::filesystem::path audit_dir = v.empty() ? (data_dir / ".." / "playlist-share-audit")
                                                : std::filesystem::path(v);
    if (audit_dir.is_relative()) audit_dir = cwd / audit_dir;
    c.audit_dir = audit_dir.lexically_normal().string();

    // invalid or non-positive => disabled, never a startup error
    c.soft_limit_bytes = parse_soft_limit(env_trimmed("PLSHARE_SOFT_LIMIT_BYTES"));

    v = env_trimmed("PLSHARE_QUOTA_CACHE_TTL_MS");
    if (!v.empty()) {
        std::int64_t ttl = 0;
        if (!parse_int64(v, &ttl) || ttl < 0) {
            if (err) *err = "PLSHARE_QUOTA_CACHE_TTL_MS must be a non-negative integer";
            return false;
        }
        c.quota_cache_ttl_ms = ttl;
    }

    v = env_trimmed("PLSHARE_LISTEN_HOST");
    if (!v.empty()) c.listen_host = v;

    v = env_trimmed("PLSHARE_LISTEN_PORT");
    if (!v.empty()) {
        std::int64_t port = 0;
        if (!parse_int64(v, &port) || port <= 0 || port > 65535) {
            if (err) *err = "PLSHARE_LISTEN_PORT must be 1..65535";
            return false;
        }
        c.listen_port = (int)port;
    }

    v = env_trimmed("PLSHARE_PUBLIC_ORIGIN");
    while (!v.empty() && v.back() == '/') v.pop_back();
    c.public_origin = v;

    *out = c;
    return true;
}

} // namespace plshare

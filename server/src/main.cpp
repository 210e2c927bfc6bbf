/*
Playlist Share Server
=====================

Serves the shared-playlist store over HTTP:
- Clients encrypt a playlist locally and upload only {iv, ciphertext, alg}
  plus a content hash. The server never sees plaintext or keys.
- Each upload becomes a public share id pointing at a content-addressed,
  deduplicated blob.
- A share created as revocable returns an edit token exactly once; presenting
  it later revokes the link and garbage-collects the blob when nothing else
  references it.

Process layout
--------------
- One store root (PLSHARE_DATA_DIR). Several server processes may share it:
  all coordination happens through link(2)/rename(2) on that filesystem.
- Hash-chained audit log in PLSHARE_AUDIT_DIR.
- Per-client and global write rate limits are process-local.

Configuration is read once at startup (see store_config.h). A malformed
settings file is fatal; an invalid soft limit just disables the quota.
*/

#include <filesystem>
#include <iostream>
#include <string>

#include <sodium.h>

// header-only HTTP server
#include "httplib.h"

#include "audit_log.h"
#include "rate_limiter.h"
#include "share_quota.h"
#include "share_routes.h"
#include "share_store.h"
#include "store_config.h"

int main()
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    plshare::StoreConfig cfg;
    std::string cfg_err;
    if (!plshare::load_store_config(&cfg, &cfg_err)) {
        std::cerr << "[settings] FATAL: " << cfg_err << std::endl;
        return 2;
    }

    try {
        std::filesystem::create_directories(cfg.data_dir);
    } catch (const std::exception& e) {
        std::cerr << "[store] FATAL: cannot create data dir " << cfg.data_dir << ": " << e.what() << std::endl;
        return 2;
    }

    // ---- Audit log (hash-chained JSONL) ----
    try {
        std::filesystem::create_directories(cfg.audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    plshare::AuditLog audit(cfg.audit_jsonl_path(), cfg.audit_state_path());
    if (!audit.set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[settings] WARNING: invalid audit_min_level " << cfg.audit_min_level
                  << ", keeping " << audit.min_level_str() << std::endl;
    }
    std::cerr << "[settings] audit_min_level=" << audit.min_level_str() << std::endl;

    // ---- Store ----
    plshare::StorageQuota quota(cfg.data_dir, cfg.soft_limit_bytes, cfg.quota_cache_ttl_ms);
    plshare::ShareStore store(cfg.data_dir, quota, &audit);

    std::cerr << "[store] data_dir=" << cfg.data_dir << std::endl;
    if (quota.enabled()) {
        std::cerr << "[quota] soft_limit_bytes=" << quota.limit_bytes()
                  << " cache_ttl_ms=" << cfg.quota_cache_ttl_ms << std::endl;
    } else {
        std::cerr << "[quota] soft limit disabled" << std::endl;
    }

    // ---- Rate limits ----
    plshare::RateLimiter create_limiter((size_t)cfg.create_rate_per_hour, 60LL * 60LL * 1000LL);
    plshare::RateLimiter write_limiter((size_t)cfg.write_rate_per_minute, 60LL * 1000LL);

    httplib::Server srv;

    ShareRoutesContext ctx;
    ctx.store = &store;
    ctx.create_limiter = &create_limiter;
    ctx.write_limiter = &write_limiter;
    ctx.public_origin = &cfg.public_origin;
    register_share_routes(srv, ctx);

    srv.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (res.status >= 500) {
            std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << std::endl;
        }
    });

    std::cerr << "[http] listening on " << cfg.listen_host << ":" << cfg.listen_port << std::endl;
    if (!srv.listen(cfg.listen_host.c_str(), cfg.listen_port)) {
        std::cerr << "[http] FATAL: listen failed on " << cfg.listen_host << ":" << cfg.listen_port << std::endl;
        return 1;
    }
    return 0;
}

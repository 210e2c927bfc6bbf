#include "share_quota.h"

#include "plshare_util.h"
#include "store_error.h"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace plshare {

/*
================================================================================
Share storage quota: Architectural Overview
================================================================================

Scan-and-sum soft limit over the whole store root (links, blobs, stray temp
files alike):

    used_bytes       = recursive sum of regular file sizes under root
    would_used_bytes = used_bytes + incoming_bytes
    reject when limit_bytes > 0 && would_used_bytes > limit_bytes

Unlike per-user storage quotas, "no limit configured" means unlimited here:
limit 0 disables the check.

incoming_bytes is computed by the caller from the exact encoded blob plus an
upper bound of the link record, so the estimate matches what will be written.

Limitations:
  - TOCTOU: the check is not a reservation. Concurrent creates can overshoot
    the limit by their combined size.
  - Recursive scans cost O(files). The optional TTL cache trades accuracy for
    fewer scans; writes made through this process are added to the cached
    value via note_written().
================================================================================
*/

static bool vanished(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

// Sums one directory level and descends into real subdirectories. A non-root
// directory that disappears while being listed (GC pruning an emptied shard)
// contributes nothing; the walk continues with its siblings.
static bool walk_dir(const std::filesystem::path& dir,
                     bool is_root,
                     std::uint64_t* total,
                     const UsageScanHook& before_descend,
                     std::string* err) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec), end;
    if (ec) {
        if (!is_root && vanished(ec)) return true;
        if (err) *err = "scan " + dir.string() + ": " + ec.message();
        return false;
    }

    std::vector<std::filesystem::path> subdirs;
    for (; it != end; it.increment(ec)) {
        const std::filesystem::path p = it->path();

        std::error_code ec2;
        const std::filesystem::file_status st = std::filesystem::symlink_status(p, ec2);
        if (ec2) {
            if (vanished(ec2)) continue;
            if (err) *err = "stat " + p.string() + ": " + ec2.message();
            return false;
        }

        if (std::filesystem::is_directory(st)) {
            subdirs.push_back(p);
        } else if (std::filesystem::is_regular_file(st)) {
            const auto sz = std::filesystem::file_size(p, ec2);
            if (!ec2) {
                *total += (std::uint64_t)sz;
            } else if (!vanished(ec2)) {
                if (err) *err = "stat " + p.string() + ": " + ec2.message();
                return false;
            }
        }
    }
    if (ec) {
        // listing of this directory was cut short; anything else is a real failure
        if (!is_root && vanished(ec)) return true;
        if (err) *err = "scan " + dir.string() + ": " + ec.message();
        return false;
    }

    for (const auto& sub : subdirs) {
        if (before_descend) before_descend(sub);
        if (!walk_dir(sub, false, total, before_descend, err)) return false;
    }
    return true;
}

bool compute_used_bytes(const std::filesystem::path& root,
                        std::uint64_t* out,
                        std::string* err,
                        const UsageScanHook& before_descend) {
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        if (ec) {
            if (err) *err = "stat " + root.string() + ": " + ec.message();
            return false;
        }
        if (out) *out = 0;
        return true;
    }

    std::uint64_t total = 0;
    if (!walk_dir(root, true, &total, before_descend, err)) return false;

    if (out) *out = total;
    return true;
}

std::uint64_t parse_soft_limit(const std::string& raw_in) {
    const std::string raw = trim_ascii(raw_in);
    if (raw.empty()) return 0;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(raw.c_str(), &end);
    if (errno != 0 || end == raw.c_str() || *end != '\0') return 0;
    if (!(v > 0) || v > 1.8e19) return 0; // also rejects NaN
    return (std::uint64_t)v;
}

StorageQuota::StorageQuota(std::filesystem::path root,
                           std::uint64_t soft_limit_bytes,
                           std::int64_t cache_ttl_ms)
    : root_(std::move(root)),
      limit_bytes_(soft_limit_bytes),
      cache_ttl_ms_(cache_ttl_ms < 0 ? 0 : cache_ttl_ms) {}

QuotaCheckResult StorageQuota::check(std::uint64_t incoming_bytes) {
    QuotaCheckResult r;
    r.incoming_bytes = incoming_bytes;
    r.limit_bytes = limit_bytes_;

    if (!enabled()) {
        r.ok = true;
        r.would_used_bytes = incoming_bytes;
        return r;
    }

    std::uint64_t used = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const std::int64_t now = now_epoch_ms();
        if (cache_ttl_ms_ > 0 && have_cache_ && now - cached_at_ms_ < cache_ttl_ms_) {
            used = cached_used_;
        } else {
            std::string err;
            if (!compute_used_bytes(root_, &used, &err)) {
                have_cache_ = false;
                throw StoreError(StoreErrc::io, "quota measurement failed: " + err);
            }
            have_cache_ = true;
            cached_used_ = used;
            cached_at_ms_ = now;
        }
    }

    r.used_bytes = used;
    r.would_used_bytes = used + incoming_bytes;

    if (r.would_used_bytes > r.limit_bytes) {
        r.ok = false;
        r.error = "quota_exceeded";
        return r;
    }

    r.ok = true;
    r.error.clear();
    return r;
}

void StorageQuota::note_written(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mu_);
    if (have_cache_) cached_used_ += bytes;
}

void StorageQuota::invalidate() {
    std::lock_guard<std::mutex> lk(mu_);
    have_cache_ = false;
}

} // namespace plshare

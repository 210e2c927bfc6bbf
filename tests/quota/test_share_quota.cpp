// tests/quota/test_share_quota.cpp
//
// Soft storage limit: parsing of the raw setting, usage measurement, and the
// preflight decision with and without the usage cache.

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include <sodium.h>

#include "plshare_util.h"
#include "share_quota.h"

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

static void write_n(const fs::path& p, size_t n) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    std::string s(n, 'x');
    f.write(s.data(), (std::streamsize)s.size());
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 1;
    }

    // --- parse_soft_limit ---
    check(parse_soft_limit("") == 0, "limit_empty");
    check(parse_soft_limit("  ") == 0, "limit_blank");
    check(parse_soft_limit("abc") == 0, "limit_garbage");
    check(parse_soft_limit("12abc") == 0, "limit_trailing_garbage");
    check(parse_soft_limit("0") == 0, "limit_zero");
    check(parse_soft_limit("-5") == 0, "limit_negative");
    check(parse_soft_limit("nan") == 0, "limit_nan");
    check(parse_soft_limit("1048576") == 1048576ull, "limit_plain");
    check(parse_soft_limit(" 2048 ") == 2048ull, "limit_trimmed");
    check(parse_soft_limit("1e3") == 1000ull, "limit_exponent");

    const fs::path root = fs::temp_directory_path() / ("plshare_quota_" + random_b64url(6));

    // --- compute_used_bytes ---
    {
        std::uint64_t used = 99;
        std::string err;
        check(compute_used_bytes(root, &used, &err) && used == 0, "used_missing_root", err);

        write_n(root / "links" / "a.json", 100);
        write_n(root / "blobs" / "ab" / "cd" / "x.json.gz", 250);
        write_n(root / "stray.tmp", 50);
        check(compute_used_bytes(root, &used, &err) && used == 400, "used_recursive_sum", std::to_string(used));
    }

    // --- shards pruned while the scan is running ---
    {
        const fs::path shards = fs::temp_directory_path() / ("plshare_quota_gc_" + random_b64url(6));
        const char* names[] = {"aa", "bb", "cc", "dd"};
        auto populate = [&] {
            for (const char* n : names) write_n(shards / "blobs" / n / "ee" / "blob.json.gz", 1000);
        };
        populate();

        std::uint64_t used = 0;
        std::string err;
        check(compute_used_bytes(shards, &used, &err) && used == 4000, "shards_full_sum", std::to_string(used));

        // GC empties and prunes a sibling shard that has been listed but not yet entered
        std::string pruned;
        auto prune_sibling = [&](const fs::path& dir) {
            if (!pruned.empty() || dir.parent_path().filename() != "blobs") return;
            for (const char* n : names) {
                if (dir.filename() == n) continue;
                pruned = n;
                fs::remove_all(shards / "blobs" / n);
                return;
            }
        };
        used = 0;
        err.clear();
        bool ok = compute_used_bytes(shards, &used, &err, prune_sibling);
        check(ok && !pruned.empty(), "pruned_sibling_scan_ok", err);
        check(used == 3000, "pruned_sibling_rest_counted", std::to_string(used));

        // the directory about to be entered disappears
        fs::remove_all(shards);
        populate();
        auto prune_self = [&](const fs::path& dir) {
            if (dir.filename() == "cc") fs::remove_all(dir);
        };
        used = 0;
        err.clear();
        ok = compute_used_bytes(shards, &used, &err, prune_self);
        check(ok && used == 3000, "pruned_entered_dir_rest_counted", std::to_string(used) + " " + err);

        // a nested level vanishing is skipped the same way
        fs::remove_all(shards);
        populate();
        auto prune_leaf = [&](const fs::path& dir) {
            if (dir.filename() == "ee" && dir.parent_path().filename() == "dd") fs::remove_all(dir);
        };
        used = 0;
        ok = compute_used_bytes(shards, &used, &err, prune_leaf);
        check(ok && used == 3000, "pruned_leaf_rest_counted", std::to_string(used));

        std::error_code ec;
        fs::remove_all(shards, ec);
    }

    // --- disabled ---
    {
        StorageQuota q(root, 0);
        check(!q.enabled(), "disabled_flag");
        QuotaCheckResult r = q.check(1ull << 40);
        check(r.ok && r.limit_bytes == 0, "disabled_allows_anything");
    }

    // --- enforcement, no cache ---
    {
        StorageQuota q(root, 500);
        QuotaCheckResult ok = q.check(100);
        check(ok.ok && ok.used_bytes == 400 && ok.would_used_bytes == 500, "at_limit_allowed");

        QuotaCheckResult over = q.check(101);
        check(!over.ok && over.error == "quota_exceeded", "over_limit_rejected");
        check(over.used_bytes == 400 && over.incoming_bytes == 101 && over.would_used_bytes == 501 &&
              over.limit_bytes == 500, "reject_details");

        write_n(root / "links" / "b.json", 100);
        check(!q.check(1).ok, "uncached_sees_new_file");
    }

    // --- cached usage ---
    {
        StorageQuota q(root, 1000, 60 * 1000);
        QuotaCheckResult r1 = q.check(0);
        check(r1.ok && r1.used_bytes == 500, "cache_first_measure", std::to_string(r1.used_bytes));

        write_n(root / "links" / "c.json", 300);
        check(q.check(0).used_bytes == 500, "cache_serves_stale");

        q.note_written(300);
        check(q.check(0).used_bytes == 800, "note_written_updates_cache");

        write_n(root / "links" / "d.json", 50);
        q.invalidate();
        check(q.check(0).used_bytes == 850, "invalidate_remeasures");
        check(!q.check(151).ok && q.check(150).ok, "cached_boundary");
    }

    std::error_code ec;
    fs::remove_all(root, ec);

    if (failures) {
        std::fprintf(stderr, "[share_quota] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[share_quota] ALL OK\n");
    return 0;
}

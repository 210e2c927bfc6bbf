#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace plshare {

    struct QuotaCheckResult {
        bool ok = false;
        std::string error;            // "" or "quota_exceeded"

        std::uint64_t used_bytes = 0;
        std::uint64_t limit_bytes = 0; // 0 => enforcement disabled
        std::uint64_t incoming_bytes = 0;
        std::uint64_t would_used_bytes = 0;
    };

    // Called with each subdirectory just before the scan descends into it.
    using UsageScanHook = std::function<void(const std::filesystem::path&)>;

    // Recursive scan of root summing regular file sizes; symlinks are not followed.
    // Missing root => 0. Files or whole subtrees vanishing mid-scan are skipped
    // and the scan carries on; any other error fails the scan.
    bool compute_used_bytes(const std::filesystem::path& root,
                            std::uint64_t* out,
                            std::string* err,
                            const UsageScanHook& before_descend = {});

    // Soft limit from a raw setting: empty, non-numeric or <= 0 => 0 (disabled).
    std::uint64_t parse_soft_limit(const std::string& raw);

    /*
    StorageQuota
      Best-effort preflight check: rejects a write when
          used + incoming > limit
      It is not a reservation; two concurrent writers can both pass.

      The measured usage may be cached for cache_ttl_ms (0 => measure on
      every call). note_written() keeps a cached value roughly current.
    */
    class StorageQuota {
    public:
        StorageQuota(std::filesystem::path root,
                     std::uint64_t soft_limit_bytes,
                     std::int64_t cache_ttl_ms = 0);

        bool enabled() const { return limit_bytes_ > 0; }
        std::uint64_t limit_bytes() const { return limit_bytes_; }

        // Throws StoreError(io) when usage cannot be measured.
        QuotaCheckResult check(std::uint64_t incoming_bytes);

        void note_written(std::uint64_t bytes);
        void invalidate();

    private:
        std::filesystem::path root_;
        std::uint64_t limit_bytes_ = 0;
        std::int64_t cache_ttl_ms_ = 0;

        // protects the cache fields below
        std::mutex mu_;
        bool have_cache_ = false;
        std::uint64_t cached_used_ = 0;
        std::int64_t cached_at_ms_ = 0;
    };

} // namespace plshare

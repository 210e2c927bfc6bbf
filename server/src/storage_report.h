#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace plshare {

    class LinkStore;

    struct StorageReport {
        std::string data_dir;

        std::uint64_t links = 0;
        std::uint64_t links_active = 0;
        std::uint64_t links_revoked = 0;
        std::uint64_t links_malformed = 0;
        std::uint64_t link_bytes = 0;

        std::uint64_t blobs = 0;
        std::uint64_t blob_bytes = 0;

        std::uint64_t temp_files = 0;     // *.tmp left behind by a crash
        std::uint64_t temp_bytes = 0;

        std::uint64_t legacy_files = 0;   // *.json outside links/ and blobs/
        std::uint64_t legacy_bytes = 0;

        std::uint64_t total_bytes() const { return link_bytes + blob_bytes + temp_bytes + legacy_bytes; }
        double dedup_ratio() const { return blobs > 0 ? (double)links / (double)blobs : 0.0; }
    };

    // "0 B", "512 B", "1.50 KB", ... up to TB
    std::string bytes_to_human(std::uint64_t bytes);

    // Walks the store root. Malformed link records are counted, not fatal.
    bool build_storage_report(const std::string& data_dir,
                              const LinkStore& links,
                              StorageReport* out,
                              std::string* err);

    std::string format_storage_report(const StorageReport& r);

} // namespace plshare

#include "storage_report.h"

#include "atomic_file.h"
#include "plshare_util.h"
#include "share_links.h"
#include "store_error.h"

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace plshare {

std::string bytes_to_human(std::uint64_t bytes) {
    if (bytes == 0) return "0 B";
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double value = (double)bytes;
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), unit == 0 ? "%.0f %s" : "%.2f %s", value, kUnits[unit]);
    return buf;
}

static bool is_under(const std::filesystem::path& p, const std::filesystem::path& dir) {
    auto rel = p.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

/*
build_storage_report()
  One recursive walk over the root; every regular file lands in exactly one
  bucket:
    - *.tmp anywhere               => temp
    - under links/                 => link (parsed for active/revoked)
    - under blobs/                 => blob
    - other *.json                 => legacy (records from before links/blobs)
  Anything else is ignored.
*/
bool build_storage_report(const std::string& data_dir,
                          const LinkStore& links,
                          StorageReport* out,
                          std::string* err) {
    if (!out) return false;
    StorageReport r;
    r.data_dir = data_dir;

    const std::filesystem::path root(data_dir);
    const std::filesystem::path links_dir = links.links_dir();
    const std::filesystem::path blobs_dir = root / "blobs";

    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        *out = r;
        return true;
    }

    for (std::filesystem::recursive_directory_iterator it(root, ec), end;
         it != end;
         it.increment(ec)) {
        if (ec) break;

        std::error_code ec2;
        if (!it->is_regular_file(ec2) || ec2) continue;
        const std::filesystem::path& p = it->path();
        const std::uint64_t sz = (std::uint64_t)it->file_size(ec2);
        if (ec2) continue;

        if (is_temp_path(p)) {
            r.temp_files++;
            r.temp_bytes += sz;
        } else if (is_under(p, links_dir)) {
            r.links++;
            r.link_bytes += sz;
            try {
                auto link = links.read_path(p);
                if (link) {
                    if (link->revoked) r.links_revoked++;
                    else r.links_active++;
                }
            } catch (const StoreError&) {
                r.links_malformed++;
            }
        } else if (is_under(p, blobs_dir)) {
            r.blobs++;
            r.blob_bytes += sz;
        } else if (lower_ascii(p.extension().string()) == ".json") {
            r.legacy_files++;
            r.legacy_bytes += sz;
        }
    }
    if (ec) {
        if (err) *err = "scan " + data_dir + ": " + ec.message();
        return false;
    }

    *out = r;
    return true;
}

std::string format_storage_report(const StorageReport& r) {
    std::ostringstream o;
    o << "Playlist Share Storage Report\n"
      << "=============================\n"
      << "Data dir: " << r.data_dir << "\n"
      << "Links: " << r.links << " (" << bytes_to_human(r.link_bytes) << ")"
      << " active=" << r.links_active << " revoked=" << r.links_revoked;
    if (r.links_malformed) o << " malformed=" << r.links_malformed;
    o << "\n"
      << "Blobs: " << r.blobs << " (" << bytes_to_human(r.blob_bytes) << ")\n"
      << "Temp files: " << r.temp_files << " (" << bytes_to_human(r.temp_bytes) << ")\n"
      << "Legacy files: " << r.legacy_files << " (" << bytes_to_human(r.legacy_bytes) << ")\n"
      << "Total size: " << bytes_to_human(r.total_bytes()) << "\n"
      << "Dedup ratio (links/blobs): " << std::fixed << std::setprecision(2) << r.dedup_ratio() << "\n";
    return o.str();
}

} // namespace plshare

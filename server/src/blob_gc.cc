#include "blob_gc.h"

#include "audit_log.h"
#include "plshare_util.h"
#include "store_error.h"

#include <iostream>
#include <system_error>
#include <vector>

namespace plshare {

const char* gc_outcome_str(GcOutcome o) {
    switch (o) {
        case GcOutcome::collected:        return "collected";
        case GcOutcome::still_referenced: return "still_referenced";
        case GcOutcome::already_absent:   return "already_absent";
        case GcOutcome::aborted:          return "aborted";
    }
    return "unknown";
}

BlobCollector::BlobCollector(const LinkStore& links, BlobStore& blobs, AuditLog* audit)
    : links_(links), blobs_(blobs), audit_(audit) {}

bool BlobCollector::has_other_active_link(const std::string& blob_hash,
                                          const std::string& excluding_share_id) const {
    for (const auto& p : links_.list_paths()) {
        auto link = links_.read_path(p);
        if (!link) continue; // removed between listing and read
        if (link->share_id == excluding_share_id) continue;
        if (link->revoked) continue;
        if (link->effective_blob_hash() == blob_hash) return true;
    }
    return false;
}

std::unordered_set<std::string> BlobCollector::active_blob_hashes() const {
    std::unordered_set<std::string> out;
    for (const auto& p : links_.list_paths()) {
        auto link = links_.read_path(p);
        if (!link || link->revoked) continue;
        out.insert(link->effective_blob_hash());
    }
    return out;
}

/*
maybe_collect()
  scan -> scan -> remove

  Any exception while scanning (unreadable directory, malformed link record)
  means we cannot prove the blob is unreferenced: abort, keep the blob.
  An orphan left behind is harmless; the operator sweep reclaims it later.
*/
GcOutcome BlobCollector::maybe_collect(const std::string& blob_hash_in,
                                       const std::string& excluding_share_id) {
    const std::string blob_hash = lower_ascii(trim_ascii(blob_hash_in));
    if (!is_sha256_hex(blob_hash)) return GcOutcome::aborted;

    GcOutcome outcome = GcOutcome::aborted;
    std::string detail;
    try {
        if (has_other_active_link(blob_hash, excluding_share_id) ||
            has_other_active_link(blob_hash, excluding_share_id)) {
            outcome = GcOutcome::still_referenced;
        } else {
            outcome = blobs_.remove(blob_hash) ? GcOutcome::collected : GcOutcome::already_absent;
        }
    } catch (const StoreError& e) {
        outcome = GcOutcome::aborted;
        detail = e.what();
        std::cerr << "[gc] WARNING: collection of " << blob_hash << " aborted: " << e.what() << std::endl;
    }

    if (audit_ && outcome != GcOutcome::still_referenced) {
        AuditEvent ev;
        ev.event = "blob.collect";
        ev.outcome = (outcome == GcOutcome::aborted) ? "fail" : "ok";
        ev.level = (outcome == GcOutcome::aborted) ? AuditLevel::SECURITY : AuditLevel::INFO;
        ev.f["blob_hash"] = blob_hash;
        ev.f["result"] = gc_outcome_str(outcome);
        if (!excluding_share_id.empty()) ev.f["share_id"] = excluding_share_id;
        if (!detail.empty()) ev.f["detail"] = detail;
        audit_->append(ev);
    }
    return outcome;
}

static bool file_older_than(const std::filesystem::path& p, std::chrono::seconds min_age, bool* older) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(p, ec);
    if (ec) return false;
    const auto age = std::filesystem::file_time_type::clock::now() - mtime;
    *older = age >= min_age;
    return true;
}

SweepReport BlobCollector::sweep_orphans(std::chrono::seconds min_age) {
    SweepReport r;

    std::vector<std::string> candidates;
    try {
        const auto active = active_blob_hashes();
        for (const auto& h : blobs_.list_hashes()) {
            r.blobs_scanned++;
            if (active.count(h)) {
                r.referenced++;
                continue;
            }
            bool older = false;
            if (!file_older_than(blobs_.path_for(h), min_age, &older)) continue; // vanished
            if (!older) {
                r.too_young++;
                continue;
            }
            candidates.push_back(h);
        }

        // second pass right before deleting
        const auto active_again = active_blob_hashes();
        for (const auto& h : candidates) {
            if (active_again.count(h)) {
                r.referenced++;
                continue;
            }
            std::error_code ec;
            const auto sz = std::filesystem::file_size(blobs_.path_for(h), ec);
            if (blobs_.remove(h)) {
                r.removed++;
                if (!ec) r.removed_bytes += (std::uint64_t)sz;
            }
        }
    } catch (const StoreError& e) {
        r.ok = false;
        r.error = e.what();
        std::cerr << "[gc] WARNING: orphan sweep aborted: " << e.what() << std::endl;
    }
    if (r.error.empty()) r.ok = true;

    if (audit_) {
        AuditEvent ev;
        ev.event = "blob.sweep";
        ev.outcome = r.ok ? "ok" : "fail";
        ev.level = AuditLevel::SECURITY;
        ev.f["scanned"] = std::to_string(r.blobs_scanned);
        ev.f["removed"] = std::to_string(r.removed);
        ev.f["removed_bytes"] = std::to_string(r.removed_bytes);
        ev.f["min_age_sec"] = std::to_string(min_age.count());
        if (!r.ok) ev.f["detail"] = r.error;
        audit_->append(ev);
    }
    return r;
}

} // namespace plshare

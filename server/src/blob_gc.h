#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

#include "blob_store.h"
#include "share_links.h"

namespace plshare {

class AuditLog;

enum class GcOutcome {
    collected,
    still_referenced,
    already_absent,
    aborted,          // scan or delete failed; nothing was removed
};

const char* gc_outcome_str(GcOutcome o);

struct SweepReport {
    bool ok = false;
    std::string error;
    size_t blobs_scanned = 0;
    size_t referenced = 0;
    size_t too_young = 0;
    size_t removed = 0;
    std::uint64_t removed_bytes = 0;
};

/*
BlobCollector
  Reference-counted deletion of blobs, driven by a full scan of link records.
  There is no stored refcount: "referenced" means some non-revoked link
  resolves to the blob hash right now.

  The scan runs twice, the second time immediately before unlink, which
  narrows (does not close) the window against a concurrent create that reuses
  the blob. ShareStore::create_share() covers the rest by re-checking the blob
  after its link is written.
*/
class BlobCollector {
public:
    BlobCollector(const LinkStore& links, BlobStore& blobs, AuditLog* audit = nullptr);

    // Never throws: failures are reported as GcOutcome::aborted.
    GcOutcome maybe_collect(const std::string& blob_hash, const std::string& excluding_share_id);

    // Operator maintenance: remove blobs that no active link references and
    // whose file is older than min_age. Aborts before deleting anything if a
    // link cannot be read.
    SweepReport sweep_orphans(std::chrono::seconds min_age);

private:
    const LinkStore& links_;
    BlobStore& blobs_;
    AuditLog* audit_ = nullptr;

    // Throws StoreError on any unreadable/malformed link.
    bool has_other_active_link(const std::string& blob_hash, const std::string& excluding_share_id) const;
    std::unordered_set<std::string> active_blob_hashes() const;
};

} // namespace plshare

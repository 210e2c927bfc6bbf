#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "blob_gc.h"
#include "blob_store.h"
#include "envelope.h"
#include "share_links.h"
#include "share_quota.h"
#include "share_revoke.h"

namespace plshare {

class AuditLog;

// Attempts at publishing a link under a fresh share id.
inline constexpr int kShareIdAttempts = 5;
// Random bytes behind a generated share id (22 base64url chars).
inline constexpr size_t kShareIdBytes = 16;

using ShareIdGenerator = std::function<std::string()>;

struct CreateShareResult {
    std::string share_id;
    std::optional<std::string> edit_token;
    std::string content_hash;
    std::string blob_hash;
    bool blob_created = false;   // false => deduplicated against an existing blob
};

struct SharedRecord {
    std::string share_id;
    std::string created_at;
    EncryptedEnvelope envelope;
};

/*
ShareStore
  The collaborator-facing operations over one store root:

    create_share(envelope, content_hash, revocable)
    read_share(share_id)
    revoke_share(share_id, token)
    reuse_share(share_id, content_hash)

  Write order is blob first, link second. A crash in between leaves an orphan
  blob, never a link pointing at nothing.

  Errors are StoreError (see store_error.h); revoke outcomes are RevokeResult.
*/
class ShareStore {
public:
    ShareStore(std::filesystem::path root,
               StorageQuota& quota,
               AuditLog* audit = nullptr,
               ShareIdGenerator gen_id = ShareIdGenerator());

    CreateShareResult create_share(const EncryptedEnvelope& envelope,
                                   const std::string& content_hash,
                                   bool revocable);

    // nullopt: malformed id, missing, revoked, not encrypted, or legacy blob.
    // Integrity failures throw.
    std::optional<SharedRecord> read_share(const std::string& share_id);

    RevokeResult revoke_share(const std::string& share_id, const std::string& edit_token);

    // True if share_id names an active link for the same content.
    bool reuse_share(const std::string& share_id, const std::string& content_hash);

    const std::filesystem::path& root() const { return root_; }
    BlobStore& blobs() { return blobs_; }
    LinkStore& links() { return links_; }
    BlobCollector& collector() { return gc_; }

private:
    std::filesystem::path root_;
    StorageQuota& quota_;
    AuditLog* audit_ = nullptr;
    ShareIdGenerator gen_id_;

    BlobStore blobs_;
    LinkStore links_;
    BlobCollector gc_;
    ShareRevoker revoker_;
};

// Trimmed, lowercased 64-hex content hash; throws StoreError(validation).
std::string normalize_content_hash(const std::string& raw);

} // namespace plshare

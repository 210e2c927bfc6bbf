#pragma once
#include <string>

#include "blob_gc.h"
#include "share_links.h"

namespace plshare {

class AuditLog;

enum class RevokeResult {
    ok,
    not_found,
    forbidden,
    already_revoked,
    unsupported,      // link was created without an edit token
};

const char* revoke_result_str(RevokeResult r);

/*
ShareRevoker
  Possession of the edit token is the only credential. Order of checks:

    1) share id format      -> not_found
    2) token length floor   -> forbidden   (before any storage access)
    3) link present         -> not_found
    4) editTokenHash set    -> unsupported
    5) already revoked      -> already_revoked
    6) sha256(token) vs stored hash, constant time -> forbidden on mismatch
    7) mark revoked, then GC the blob

  Throws StoreError for malformed link records and I/O failures.
*/
class ShareRevoker {
public:
    ShareRevoker(LinkStore& links, BlobCollector& gc, AuditLog* audit = nullptr);

    RevokeResult revoke(const std::string& share_id, const std::string& presented_token);

private:
    LinkStore& links_;
    BlobCollector& gc_;
    AuditLog* audit_ = nullptr;

    void audit_result(const std::string& share_id, RevokeResult r, const std::string& gc_result);
};

// Constant-time comparison of sha256(trim(token)) with a stored hex digest.
bool edit_token_matches(const std::string& stored_hash_hex, const std::string& presented_token);

} // namespace plshare

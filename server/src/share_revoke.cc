#include "share_revoke.h"

#include "audit_log.h"
#include "plshare_util.h"

#include <vector>

#include <sodium.h>

namespace plshare {

const char* revoke_result_str(RevokeResult r) {
    switch (r) {
        case RevokeResult::ok:              return "ok";
        case RevokeResult::not_found:       return "not_found";
        case RevokeResult::forbidden:       return "forbidden";
        case RevokeResult::already_revoked: return "already_revoked";
        case RevokeResult::unsupported:     return "unsupported";
    }
    return "unknown";
}

bool edit_token_matches(const std::string& stored_hash_hex, const std::string& presented_token) {
    std::vector<unsigned char> expected;
    if (!from_hex(stored_hash_hex, &expected) || expected.size() != 32) return false;

    auto received = sha256_bytes(trim_ascii(presented_token));
    const bool eq = sodium_memcmp(expected.data(), received.data(), received.size()) == 0;
    sodium_memzero(received.data(), received.size());
    return eq;
}

ShareRevoker::ShareRevoker(LinkStore& links, BlobCollector& gc, AuditLog* audit)
    : links_(links), gc_(gc), audit_(audit) {}

void ShareRevoker::audit_result(const std::string& share_id, RevokeResult r, const std::string& gc_result) {
    if (!audit_) return;
    AuditEvent ev;
    ev.event = "share.revoke";
    ev.outcome = (r == RevokeResult::ok || r == RevokeResult::already_revoked) ? "ok" : "deny";
    ev.level = (r == RevokeResult::forbidden) ? AuditLevel::SECURITY : AuditLevel::INFO;
    ev.f["share_id"] = share_id;
    ev.f["result"] = revoke_result_str(r);
    if (!gc_result.empty()) ev.f["gc"] = gc_result;
    audit_->append(ev);
}

RevokeResult ShareRevoker::revoke(const std::string& share_id_in, const std::string& presented_token) {
    const std::string share_id = trim_ascii(share_id_in);
    if (!is_share_id(share_id)) return RevokeResult::not_found;

    const std::string token = trim_ascii(presented_token);
    if (token.size() < kMinEditTokenLen) {
        audit_result(share_id, RevokeResult::forbidden, "");
        return RevokeResult::forbidden;
    }

    auto link = links_.get(share_id);
    if (!link) return RevokeResult::not_found;

    if (!link->revocable()) {
        audit_result(share_id, RevokeResult::unsupported, "");
        return RevokeResult::unsupported;
    }
    if (link->revoked) {
        audit_result(share_id, RevokeResult::already_revoked, "");
        return RevokeResult::already_revoked;
    }
    if (!edit_token_matches(link->edit_token_hash, token)) {
        audit_result(share_id, RevokeResult::forbidden, "");
        return RevokeResult::forbidden;
    }

    links_.mark_revoked(*link);

    // The revoke is already durable; GC problems only leave an orphan blob.
    const GcOutcome gc = gc_.maybe_collect(link->effective_blob_hash(), share_id);
    audit_result(share_id, RevokeResult::ok, gc_outcome_str(gc));
    return RevokeResult::ok;
}

} // namespace plshare

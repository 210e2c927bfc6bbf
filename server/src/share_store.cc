#include "share_store.h"

#include "audit_log.h"
#include "plshare_util.h"
#include "store_error.h"

#include <iostream>

namespace plshare {

/*
================================================================================
Share Store: Architectural Overview
================================================================================

Storage layout under one root:

    <root>/links/<shareId>.json              mutable by revoke only
    <root>/blobs/<hh>/<hh>/<hash>.json.gz    immutable, content addressed

create_share():
    validate (no I/O) -> hash -> encode blob -> quota preflight
      -> put blob (create-if-absent) -> publish link (up to 5 ids)
      -> re-check blob (a concurrent GC may have removed it) -> audit

read_share():
    link -> revoked? -> blob (verified against its address) -> envelope

Concurrency:
  - No locks. Uniqueness of share ids and blob files comes from link(2)
    refusing to overwrite; revocation uses rename(2).
  - The only known race is GC deleting a blob while a new link to it is being
    written. The GC double scan and the post-link re-check here make that
    window small; a reader hitting it gets an integrity error, not bad data.
================================================================================
*/

std::string normalize_content_hash(const std::string& raw) {
    std::string h = lower_ascii(trim_ascii(raw));
    if (!is_sha256_hex(h)) throw StoreError(StoreErrc::validation, "invalid content hash");
    return h;
}

static std::string default_share_id() {
    return random_b64url(kShareIdBytes);
}

ShareStore::ShareStore(std::filesystem::path root,
                       StorageQuota& quota,
                       AuditLog* audit,
                       ShareIdGenerator gen_id)
    : root_(std::move(root)),
      quota_(quota),
      audit_(audit),
      gen_id_(gen_id ? std::move(gen_id) : ShareIdGenerator(default_share_id)),
      blobs_(root_),
      links_(root_),
      gc_(links_, blobs_, audit),
      revoker_(links_, gc_, audit) {}

CreateShareResult ShareStore::create_share(const EncryptedEnvelope& envelope,
                                           const std::string& content_hash_in,
                                           bool revocable) {
    const std::string content_hash = normalize_content_hash(content_hash_in);
    const EncryptedEnvelope normalized = normalize_envelope(envelope);
    const std::string blob_hash = envelope_blob_hash(normalized);

    const std::string blob_bytes = blobs_.encode(blob_hash, normalized);
    const std::uint64_t link_bytes = LinkStore::estimate_record_bytes(revocable);

    QuotaCheckResult q = quota_.check(blob_bytes.size() + link_bytes);
    if (!q.ok) {
        if (audit_) {
            AuditEvent ev;
            ev.event = "quota.reject";
            ev.outcome = "deny";
            ev.f["used_bytes"] = std::to_string(q.used_bytes);
            ev.f["limit_bytes"] = std::to_string(q.limit_bytes);
            ev.f["incoming_bytes"] = std::to_string(q.incoming_bytes);
            audit_->append(ev);
        }
        throw StoreError(StoreErrc::quota, "playlist share storage limit exceeded");
    }

    CreateShareResult out;
    out.content_hash = content_hash;
    out.blob_hash = blob_hash;
    out.blob_created = blobs_.put_encoded(blob_hash, blob_bytes);

    LinkCreateResult lr;
    for (int attempt = 0; attempt < kShareIdAttempts && !lr.created; attempt++) {
        const std::string id = gen_id_();
        if (!is_share_id(id)) {
            std::cerr << "[store] WARNING: id generator produced an invalid share id" << std::endl;
            continue;
        }
        lr = links_.create(id, content_hash, blob_hash, revocable);
    }

    if (!lr.created) {
        if (out.blob_created) {
            const GcOutcome gc = gc_.maybe_collect(blob_hash, "");
            std::cerr << "[store] WARNING: share id retries exhausted, orphan blob "
                      << blob_hash << ": " << gc_outcome_str(gc) << std::endl;
        }
        throw StoreError(StoreErrc::collision, "failed to allocate a unique share id");
    }

    // A revoke of the last other link may have collected the blob between
    // put and link publication. Put it back.
    if (!blobs_.exists(blob_hash)) {
        std::cerr << "[store] WARNING: blob " << blob_hash
                  << " vanished during create of " << lr.link.share_id << ", rewriting" << std::endl;
        if (blobs_.put_encoded(blob_hash, blob_bytes)) out.blob_created = true;
    }

    quota_.note_written((out.blob_created ? blob_bytes.size() : 0) + LinkStore::serialize(lr.link).size());

    out.share_id = lr.link.share_id;
    out.edit_token = lr.edit_token;

    if (audit_) {
        AuditEvent ev;
        ev.event = "share.create";
        ev.outcome = "ok";
        ev.f["share_id"] = out.share_id;
        ev.f["blob_hash"] = blob_hash;
        ev.f["blob_created"] = out.blob_created ? "true" : "false";
        ev.f["revocable"] = revocable ? "true" : "false";
        audit_->append(ev);
    }
    return out;
}

std::optional<SharedRecord> ShareStore::read_share(const std::string& share_id_in) {
    const std::string share_id = trim_ascii(share_id_in);
    if (!is_share_id(share_id)) return std::nullopt;

    auto link = links_.get(share_id);
    if (!link || link->revoked || !link->encrypted) return std::nullopt;

    BlobReadResult blob;
    try {
        blob = blobs_.get(link->effective_blob_hash());
    } catch (const StoreError& e) {
        if (e.code() == StoreErrc::integrity) {
            std::cerr << "[store] ERROR: " << e.what() << std::endl;
            if (audit_) {
                AuditEvent ev;
                ev.event = "blob.integrity";
                ev.outcome = "fail";
                ev.level = AuditLevel::SECURITY;
                ev.f["share_id"] = share_id;
                ev.f["blob_hash"] = link->effective_blob_hash();
                ev.f["detail"] = e.what();
                audit_->append(ev);
            }
        }
        throw;
    }
    if (blob.legacy_plaintext) return std::nullopt;

    SharedRecord r;
    r.share_id = link->share_id;
    r.created_at = link->created_at;
    r.envelope = std::move(blob.envelope);
    return r;
}

RevokeResult ShareStore::revoke_share(const std::string& share_id, const std::string& edit_token) {
    return revoker_.revoke(share_id, edit_token);
}

bool ShareStore::reuse_share(const std::string& share_id_in, const std::string& content_hash_in) {
    const std::string share_id = trim_ascii(share_id_in);
    if (!is_share_id(share_id)) return false;
    const std::string content_hash = lower_ascii(trim_ascii(content_hash_in));
    if (!is_sha256_hex(content_hash)) return false;

    auto link = links_.get(share_id);
    return link && !link->revoked && link->content_hash == content_hash;
}

} // namespace plshare

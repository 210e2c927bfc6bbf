#include "share_links.h"

#include "atomic_file.h"
#include "plshare_util.h"
#include "store_error.h"

#include <cstdint>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace plshare {

/*
================================================================================
Share Links: Architectural Overview
================================================================================

A link is the mutable half of a share: it maps a public share id to the blob
holding the encrypted playlist, and carries the revocation state.

Data model:
  - ShareLink: { share_id, content_hash, blob_hash, created_at, revoked,
                 encrypted, edit_token_hash }
  - blob_hash is the storage address. content_hash is the caller's logical
    hash and doubles as the address for records written before blob_hash
    existed.

Persistence strategy:
  - One file per link instead of one registry file. There is no in-memory
    index and no lock; each operation goes to disk.
  - create(): create_unique_file() (tmp + link(2)). Losing the race yields
    created=false and the caller retries with a new id.
  - mark_revoked(): replace_file_atomic() (tmp + rename(2)).

Security considerations:
  - Edit tokens are 24 random bytes from libsodium, base64url without padding.
  - Only sha256(token) is written to disk. The plaintext token is returned
    once, from the create() call that published the record.

Parsing is strict: a record that exists but does not parse is a validation
error for that record, never silently skipped here. Scanners decide how to
react (the GC aborts).
================================================================================
*/

static const char* kLinkSuffix = ".json";

std::string hash_edit_token(const std::string& token) {
    return sha256_hex(trim_ascii(token));
}

LinkStore::LinkStore(std::filesystem::path root)
    : links_dir_(std::move(root) / "links") {}

std::filesystem::path LinkStore::path_for(const std::string& share_id) const {
    return links_dir_ / (share_id + kLinkSuffix);
}


//------------------------------------------------------------------------------
// Record codec
//------------------------------------------------------------------------------

std::string LinkStore::serialize(const ShareLink& s) {
    json it;
    it["version"] = 1;
    it["shareId"] = s.share_id;
    it["contentHash"] = s.content_hash;
    it["blobHash"] = s.effective_blob_hash();
    it["createdAt"] = s.created_at;
    it["revoked"] = s.revoked;
    it["encrypted"] = s.encrypted;
    if (!s.edit_token_hash.empty()) it["editTokenHash"] = s.edit_token_hash;
    return it.dump(2) + "\n";
}

static std::string opt_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "";
    if (!j[key].is_string()) {
        throw StoreError(StoreErrc::validation, std::string("link field not a string: ") + key);
    }
    return trim_ascii(j[key].get<std::string>());
}

static bool opt_bool(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return false;
    if (!j[key].is_boolean()) {
        throw StoreError(StoreErrc::validation, std::string("link field not a boolean: ") + key);
    }
    return j[key].get<bool>();
}

/*
parse()
  Accepts version 1 records. Hashes are lowercased; createdAt is normalized to
  the millisecond form. Any violation throws StoreError(validation).
*/
ShareLink LinkStore::parse(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        throw StoreError(StoreErrc::validation, std::string("link record parse failed: ") + e.what());
    }
    if (!j.is_object()) throw StoreError(StoreErrc::validation, "link record is not an object");

    if (!j.contains("version") || !j["version"].is_number_integer() || j["version"].get<std::int64_t>() != 1) {
        throw StoreError(StoreErrc::validation, "unsupported link record version");
    }

    ShareLink s;
    s.share_id = opt_string(j, "shareId");
    if (!is_share_id(s.share_id)) throw StoreError(StoreErrc::validation, "invalid shareId in link record");

    s.content_hash = lower_ascii(opt_string(j, "contentHash"));
    if (!is_sha256_hex(s.content_hash)) throw StoreError(StoreErrc::validation, "invalid contentHash in link record");

    s.blob_hash = lower_ascii(opt_string(j, "blobHash"));
    if (!s.blob_hash.empty() && !is_sha256_hex(s.blob_hash)) {
        throw StoreError(StoreErrc::validation, "invalid blobHash in link record");
    }

    if (!parse_iso_utc(opt_string(j, "createdAt"), &s.created_at)) {
        throw StoreError(StoreErrc::validation, "invalid createdAt in link record");
    }

    s.revoked = opt_bool(j, "revoked");
    s.encrypted = opt_bool(j, "encrypted");

    s.edit_token_hash = lower_ascii(opt_string(j, "editTokenHash"));
    if (!s.edit_token_hash.empty() && !is_sha256_hex(s.edit_token_hash)) {
        throw StoreError(StoreErrc::validation, "invalid editTokenHash in link record");
    }
    return s;
}

size_t LinkStore::estimate_record_bytes(bool revocable) {
    ShareLink probe;
    probe.share_id = std::string(64, 'x');
    probe.content_hash = std::string(64, '0');
    probe.blob_hash = std::string(64, '0');
    probe.created_at = "0000-00-00T00:00:00.000Z";
    probe.revoked = false; // "false" is longer than "true"
    if (revocable) probe.edit_token_hash = std::string(64, '0');
    return serialize(probe).size();
}


//------------------------------------------------------------------------------
// Mutations
//------------------------------------------------------------------------------

LinkCreateResult LinkStore::create(const std::string& share_id,
                                   const std::string& content_hash,
                                   const std::string& blob_hash,
                                   bool revocable) {
    if (!is_share_id(share_id)) throw StoreError(StoreErrc::validation, "invalid share id");
    if (!is_sha256_hex(content_hash) || !is_sha256_hex(blob_hash)) {
        throw StoreError(StoreErrc::validation, "invalid hash for link");
    }

    LinkCreateResult r;
    r.link.share_id = share_id;
    r.link.content_hash = content_hash;
    r.link.blob_hash = blob_hash;
    r.link.created_at = now_iso_utc();
    r.link.revoked = false;
    r.link.encrypted = true;

    std::string token;
    if (revocable) {
        token = random_b64url(kEditTokenBytes);
        r.link.edit_token_hash = hash_edit_token(token);
    }

    std::string err;
    switch (create_unique_file(path_for(share_id), serialize(r.link), &err)) {
        case CreateStatus::created:
            r.created = true;
            if (revocable) r.edit_token = token;
            return r;
        case CreateStatus::exists:
            r.created = false;
            return r;
        case CreateStatus::failed:
            break;
    }
    throw StoreError(StoreErrc::io, "link write failed: " + err);
}

void LinkStore::mark_revoked(const ShareLink& link) {
    if (!is_share_id(link.share_id)) throw StoreError(StoreErrc::validation, "invalid share id");
    ShareLink updated = link;
    updated.revoked = true;

    std::string err;
    if (!replace_file_atomic(path_for(link.share_id), serialize(updated), &err)) {
        throw StoreError(StoreErrc::io, "link revoke write failed: " + err);
    }
}


//------------------------------------------------------------------------------
// Queries
//------------------------------------------------------------------------------

std::optional<ShareLink> LinkStore::read_path(const std::filesystem::path& p) const {
    std::string text, err;
    switch (read_file_bytes(p, &text, &err)) {
        case ReadStatus::ok:      break;
        case ReadStatus::missing: return std::nullopt;
        case ReadStatus::failed:
            throw StoreError(StoreErrc::io, "link read failed: " + err);
    }
    return parse(text);
}

std::optional<ShareLink> LinkStore::get(const std::string& share_id) const {
    const std::string id = trim_ascii(share_id);
    if (!is_share_id(id)) return std::nullopt;

    auto link = read_path(path_for(id));
    if (link && link->share_id != id) {
        throw StoreError(StoreErrc::validation, "link record id does not match file name: " + id);
    }
    return link;
}

std::vector<std::filesystem::path> LinkStore::list_paths() const {
    std::vector<std::filesystem::path> out;
    std::error_code ec;

    std::filesystem::directory_iterator it(links_dir_, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) return out;
        throw StoreError(StoreErrc::io, "link listing failed: " + ec.message());
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code ec2;
        if (!it->is_regular_file(ec2) || ec2) continue;
        const std::filesystem::path& p = it->path();
        if (lower_ascii(p.extension().string()) != kLinkSuffix) continue;
        out.push_back(p);
    }
    if (ec) throw StoreError(StoreErrc::io, "link listing failed: " + ec.message());
    return out;
}

} // namespace plshare

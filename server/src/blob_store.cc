#include "blob_store.h"

#include "atomic_file.h"
#include "gzip_codec.h"
#include "plshare_util.h"
#include "store_error.h"

#include <system_error>

namespace plshare {

static const char* kBlobSuffix = ".json.gz";

BlobStore::BlobStore(std::filesystem::path root)
    : blobs_dir_(std::move(root) / "blobs") {}

void BlobStore::require_hash(const std::string& hash) {
    if (!is_sha256_hex(hash)) {
        throw StoreError(StoreErrc::validation, "invalid blob hash");
    }
}

// Two 2-char shard levels keep every directory under 256 entries until the
// store holds tens of millions of blobs.
std::filesystem::path BlobStore::path_for(const std::string& hash) const {
    require_hash(hash);
    return blobs_dir_ / hash.substr(0, 2) / hash.substr(2, 2) / (hash + kBlobSuffix);
}

std::string BlobStore::encode(const std::string& hash, const EncryptedEnvelope& envelope) const {
    require_hash(hash);
    EncryptedBlobV2 body;
    body.encrypted = normalize_envelope(envelope);
    body.checksum = hash;

    if (envelope_blob_hash(body.encrypted) != hash) {
        throw StoreError(StoreErrc::validation, "blob hash does not match envelope");
    }

    std::string compressed, err;
    if (!gzip_compress(serialize_blob_record(body), &compressed, &err)) {
        throw StoreError(StoreErrc::io, "blob compression failed: " + err);
    }
    return compressed;
}

bool BlobStore::put(const std::string& hash, const EncryptedEnvelope& envelope) {
    return put_encoded(hash, encode(hash, envelope));
}

bool BlobStore::put_encoded(const std::string& hash, const std::string& file_bytes) {
    const std::filesystem::path p = path_for(hash);

    std::string err;
    switch (create_unique_file(p, file_bytes, &err)) {
        case CreateStatus::created: return true;
        case CreateStatus::exists:  return false;
        case CreateStatus::failed:  break;
    }
    throw StoreError(StoreErrc::io, "blob write failed: " + err);
}

/*
get()
  1) read file (missing => integrity: a live link points at nothing)
  2) strict gunzip (header, CRC32, ISIZE, no trailing bytes)
  3) parse tagged record; legacy plaintext is reported, not decoded
  4) recompute address from the envelope; must equal requested hash
  5) stored checksum, when present, must equal the recomputed hash
*/
BlobReadResult BlobStore::get(const std::string& hash) const {
    const std::filesystem::path p = path_for(hash);

    std::string raw, err;
    switch (read_file_bytes(p, &raw, &err)) {
        case ReadStatus::ok: break;
        case ReadStatus::missing:
            throw StoreError(StoreErrc::integrity, "blob missing: " + hash);
        case ReadStatus::failed:
            throw StoreError(StoreErrc::io, "blob read failed: " + err);
    }

    std::string body;
    if (!gzip_decompress(raw, &body, &err)) {
        throw StoreError(StoreErrc::integrity, "blob " + hash + " undecodable: " + err);
    }

    BlobRecord rec;
    try {
        rec = parse_blob_record(body);
    } catch (const StoreError& e) {
        throw StoreError(StoreErrc::integrity, "blob " + hash + " malformed: " + e.what());
    }

    BlobReadResult out;
    if (std::holds_alternative<LegacyPlaintextBlob>(rec)) {
        out.legacy_plaintext = true;
        return out;
    }

    const EncryptedBlobV2& v2 = std::get<EncryptedBlobV2>(rec);
    const std::string actual = envelope_blob_hash(v2.encrypted);
    if (actual != hash) {
        throw StoreError(StoreErrc::integrity, "blob " + hash + " integrity check failed");
    }
    if (!v2.checksum.empty() && v2.checksum != actual) {
        throw StoreError(StoreErrc::integrity, "blob " + hash + " checksum mismatch");
    }

    out.envelope = v2.encrypted;
    return out;
}

bool BlobStore::remove(const std::string& hash) {
    const std::filesystem::path p = path_for(hash);
    bool removed = false;
    std::string err;
    if (!remove_file_if_present(p, &removed, &err)) {
        throw StoreError(StoreErrc::io, "blob delete failed: " + err);
    }

    // Drop emptied shard directories; a concurrent put recreates them.
    if (removed) {
        std::error_code ec;
        std::filesystem::path dir = p.parent_path();
        for (int i = 0; i < 2 && dir != blobs_dir_; i++) {
            if (!std::filesystem::remove(dir, ec)) break; // fails unless empty
            dir = dir.parent_path();
        }
    }
    return removed;
}

bool BlobStore::exists(const std::string& hash) const {
    std::error_code ec;
    bool present = std::filesystem::exists(path_for(hash), ec);
    if (ec) throw StoreError(StoreErrc::io, "blob stat failed: " + ec.message());
    return present;
}

std::vector<std::string> BlobStore::list_hashes() const {
    std::vector<std::string> out;
    std::error_code ec;
    if (!std::filesystem::exists(blobs_dir_, ec)) return out;

    const std::string suffix = kBlobSuffix;
    for (std::filesystem::recursive_directory_iterator it(blobs_dir_, ec), end;
         it != end;
         it.increment(ec)) {
        if (ec) break;
        std::error_code ec2;
        if (!it->is_regular_file(ec2) || ec2) continue;

        const std::string name = it->path().filename().string();
        if (name.size() != 64 + suffix.size()) continue;
        if (name.compare(64, suffix.size(), suffix) != 0) continue;
        const std::string h = name.substr(0, 64);
        if (is_sha256_hex(h)) out.push_back(h);
    }
    if (ec) throw StoreError(StoreErrc::io, "blob listing failed: " + ec.message());
    return out;
}

} // namespace plshare

#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "envelope.h"

namespace plshare {

// Result of reading a blob that parsed cleanly.
struct BlobReadResult {
    bool legacy_plaintext = false;   // version 1 body, never served
    EncryptedEnvelope envelope;      // valid when !legacy_plaintext
};

/*
BlobStore
  Content-addressed, gzip-compressed, write-once storage of encrypted envelopes.

  Layout:
    <root>/blobs/<hash[0:2]>/<hash[2:4]>/<hash>.json.gz

  Blobs are never rewritten. put() publishes with create-if-absent, get()
  re-derives the address from the decoded envelope before returning it.

  All methods throw StoreError:
    - validation : hash is not 64 lowercase hex / envelope malformed
    - integrity  : stored bytes do not decode or do not hash to their address
    - io         : filesystem failure
*/
class BlobStore {
public:
    explicit BlobStore(std::filesystem::path root);

    const std::filesystem::path& blobs_dir() const { return blobs_dir_; }

    std::filesystem::path path_for(const std::string& hash) const;

    // Serialized + compressed file body for (hash, envelope). Pure.
    // hash must equal envelope_blob_hash(envelope).
    std::string encode(const std::string& hash, const EncryptedEnvelope& envelope) const;

    // true if this call created the file, false if the blob already existed.
    bool put(const std::string& hash, const EncryptedEnvelope& envelope);
    bool put_encoded(const std::string& hash, const std::string& file_bytes);

    BlobReadResult get(const std::string& hash) const;

    // true if a file was removed; already-absent is success (false).
    bool remove(const std::string& hash);

    bool exists(const std::string& hash) const;

    // All blob hashes currently on disk (temp files and strays skipped).
    std::vector<std::string> list_hashes() const;

private:
    std::filesystem::path blobs_dir_;

    static void require_hash(const std::string& hash);
};

} // namespace plshare

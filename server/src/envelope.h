#pragma once
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace plshare {

// Only algorithm the share clients produce (AES-256-GCM, JWE naming).
inline constexpr const char* kEnvelopeAlg = "A256GCM";
inline constexpr int kEnvelopeVersion = 1;
inline constexpr int kBlobVersion = 2;

// Pre-encrypted playlist payload. The store never decrypts it; only the
// exact bytes of iv/ciphertext matter.
struct EncryptedEnvelope {
    int version = kEnvelopeVersion;
    std::string alg = kEnvelopeAlg;
    std::string iv;          // base64url, 12..40 chars
    std::string ciphertext;  // base64url, 24..2,000,000 chars

    bool operator==(const EncryptedEnvelope& o) const {
        return version == o.version && alg == o.alg && iv == o.iv && ciphertext == o.ciphertext;
    }
    bool operator!=(const EncryptedEnvelope& o) const { return !(*this == o); }
};

// Current on-disk blob body: {version:2, encrypted:{...}, checksum}
struct EncryptedBlobV2 {
    EncryptedEnvelope encrypted;
    std::string checksum;    // may be empty in hand-made records
};

// version 1 blobs held a plaintext playlist. They are recognized so that
// reads can refuse them explicitly, never served.
struct LegacyPlaintextBlob {};

using BlobRecord = std::variant<EncryptedBlobV2, LegacyPlaintextBlob>;

// Validate + normalize a JSON envelope object.
// Throws StoreError(validation) on any shape violation.
EncryptedEnvelope envelope_from_json(const nlohmann::json& j);

// Validate an already-typed envelope (same rules as envelope_from_json).
// Returns the trimmed copy.
EncryptedEnvelope normalize_envelope(const EncryptedEnvelope& e);

nlohmann::json envelope_to_json(const EncryptedEnvelope& e);

// Canonical bytes, fixed field order, no whitespace:
//   {"version":1,"alg":"A256GCM","iv":"...","ciphertext":"..."}
// Input must already be normalized.
std::string canonical_envelope_bytes(const EncryptedEnvelope& e);

// Blob address: lowercase hex SHA-256 of the canonical bytes.
// Validates first; throws StoreError(validation) on malformed input.
std::string envelope_blob_hash(const EncryptedEnvelope& e);

// Blob body codec (JSON, before compression).
std::string serialize_blob_record(const EncryptedBlobV2& b);
// Throws StoreError(validation) for unknown versions / malformed bodies.
BlobRecord parse_blob_record(const std::string& json_text);

} // namespace plshare

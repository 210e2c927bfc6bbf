#include "envelope.h"

#include "plshare_util.h"
#include "store_error.h"

#include <cstdint>

using json = nlohmann::json;

namespace plshare {

/*
================================================================================
Envelope canonicalization
================================================================================

The blob address of a share is SHA-256 over a canonical serialization of the
encrypted envelope. Everything that writes or re-verifies a blob goes through
envelope_blob_hash(); there is no second code path that hashes envelopes.

Canonical form (string-built to lock field order):

  {"version":1,"alg":"A256GCM","iv":"<iv>","ciphertext":"<ciphertext>"}

iv and ciphertext are restricted to the base64url alphabet before they reach
this point, so no JSON escaping is ever required and the bytes are identical
to what a JSON.stringify() of the same object produces on the client side.
================================================================================
*/

static constexpr size_t kIvMinLen = 12;
static constexpr size_t kIvMaxLen = 40;
static constexpr size_t kCiphertextMinLen = 24;
static constexpr size_t kCiphertextMaxLen = 2000000;

[[noreturn]] static void reject(const std::string& what) {
    throw StoreError(StoreErrc::validation, "invalid encrypted envelope: " + what);
}

static std::string check_b64url_field(const std::string& raw, const char* name,
                                      size_t min_len, size_t max_len) {
    std::string v = trim_ascii(raw);
    if (v.empty()) reject(std::string("missing ") + name);
    if (!is_b64url_alphabet(v)) reject(std::string(name) + " is not base64url");
    if (v.size() < min_len || v.size() > max_len) reject(std::string(name) + " length out of range");
    return v;
}

EncryptedEnvelope normalize_envelope(const EncryptedEnvelope& e) {
    if (e.version != kEnvelopeVersion) reject("unsupported version");
    EncryptedEnvelope out;
    out.version = kEnvelopeVersion;
    out.alg = trim_ascii(e.alg);
    if (out.alg != kEnvelopeAlg) reject("unsupported alg");
    out.iv = check_b64url_field(e.iv, "iv", kIvMinLen, kIvMaxLen);
    out.ciphertext = check_b64url_field(e.ciphertext, "ciphertext", kCiphertextMinLen, kCiphertextMaxLen);
    return out;
}

EncryptedEnvelope envelope_from_json(const json& j) {
    if (!j.is_object()) reject("not an object");

    if (!j.contains("version") || !j["version"].is_number_integer()) reject("missing version");
    if (!j.contains("alg") || !j["alg"].is_string()) reject("missing alg");
    if (!j.contains("iv") || !j["iv"].is_string()) reject("missing iv");
    if (!j.contains("ciphertext") || !j["ciphertext"].is_string()) reject("missing ciphertext");

    // compared at full width so that e.g. 2^32 + 1 cannot pass as 1
    const std::int64_t version = j["version"].get<std::int64_t>();
    if (version != kEnvelopeVersion) reject("unsupported version");

    EncryptedEnvelope e;
    e.version = kEnvelopeVersion;
    e.alg = j["alg"].get<std::string>();
    e.iv = j["iv"].get<std::string>();
    e.ciphertext = j["ciphertext"].get<std::string>();
    return normalize_envelope(e);
}

json envelope_to_json(const EncryptedEnvelope& e) {
    json j;
    j["version"] = e.version;
    j["alg"] = e.alg;
    j["iv"] = e.iv;
    j["ciphertext"] = e.ciphertext;
    return j;
}

std::string canonical_envelope_bytes(const EncryptedEnvelope& e) {
    std::string s;
    s.reserve(e.iv.size() + e.ciphertext.size() + 64);
    s += "{\"version\":";
    s += std::to_string(e.version);
    s += ",\"alg\":\"";
    s += e.alg;
    s += "\",\"iv\":\"";
    s += e.iv;
    s += "\",\"ciphertext\":\"";
    s += e.ciphertext;
    s += "\"}";
    return s;
}

std::string envelope_blob_hash(const EncryptedEnvelope& e) {
    return sha256_hex(canonical_envelope_bytes(normalize_envelope(e)));
}

std::string serialize_blob_record(const EncryptedBlobV2& b) {
    json j;
    j["version"] = kBlobVersion;
    j["encrypted"] = envelope_to_json(b.encrypted);
    j["checksum"] = b.checksum;
    return j.dump();
}

/*
parse_blob_record()
  - Dispatches on "version":
      2 -> EncryptedBlobV2 (envelope validated, checksum lowercased)
      1 -> LegacyPlaintextBlob
      anything else -> validation error
  - Never guesses the shape by probing for optional fields.
*/
BlobRecord parse_blob_record(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const std::exception& e) {
        throw StoreError(StoreErrc::validation, std::string("blob json parse failed: ") + e.what());
    }
    if (!j.is_object()) throw StoreError(StoreErrc::validation, "blob body is not an object");
    if (!j.contains("version") || !j["version"].is_number_integer()) {
        throw StoreError(StoreErrc::validation, "blob body has no version");
    }

    const std::int64_t version = j["version"].get<std::int64_t>();
    if (version == 1) return LegacyPlaintextBlob{};
    if (version != kBlobVersion) {
        throw StoreError(StoreErrc::validation, "unknown blob version " + std::to_string(version));
    }

    if (!j.contains("encrypted")) throw StoreError(StoreErrc::validation, "blob body has no envelope");

    EncryptedBlobV2 b;
    b.encrypted = envelope_from_json(j["encrypted"]);
    if (j.contains("checksum")) {
        if (!j["checksum"].is_string()) throw StoreError(StoreErrc::validation, "blob checksum is not a string");
        b.checksum = lower_ascii(trim_ascii(j["checksum"].get<std::string>()));
    }
    return b;
}

} // namespace plshare

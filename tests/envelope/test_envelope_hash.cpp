// tests/envelope/test_envelope_hash.cpp
//
// Envelope canonicalization + blob record codec.
//
// What it tests:
// 1) canonical bytes are exactly {"version":1,"alg":...,"iv":...,"ciphertext":...}
// 2) blob hash matches a frozen SHA-256 vector
// 3) surrounding whitespace does not change the hash, any payload change does
// 4) malformed envelopes are rejected with a validation error
// 5) blob records dispatch on version (2 => encrypted, 1 => legacy, else error)

#include <cstdio>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "envelope.h"
#include "store_error.h"

using json = nlohmann::json;
using namespace plshare;

static int failures = 0;

static void check(bool cond, const char* name, const std::string& detail = "") {
    if (cond) {
        std::printf("[%s] OK\n", name);
    } else {
        std::fprintf(stderr, "[%s] FAIL %s\n", name, detail.c_str());
        failures++;
    }
}

static const char* kIv = "AAECAwQFBgcICQoL";
static const char* kCt = "c2VjcmV0LXBsYXlsaXN0LWNpcGhlcnRleHQ";
static const char* kExpectedCanonical =
    "{\"version\":1,\"alg\":\"A256GCM\",\"iv\":\"AAECAwQFBgcICQoL\","
    "\"ciphertext\":\"c2VjcmV0LXBsYXlsaXN0LWNpcGhlcnRleHQ\"}";
static const char* kExpectedHash = "682942206660cdeeb44170737c728c1c16a9023317814ef3a03a640fad68643a";

static EncryptedEnvelope sample() {
    EncryptedEnvelope e;
    e.iv = kIv;
    e.ciphertext = kCt;
    return e;
}

// true if f() throws StoreError(validation)
template <typename F>
static bool rejects(F f) {
    try {
        f();
    } catch (const StoreError& e) {
        return e.code() == StoreErrc::validation;
    }
    return false;
}

int main() {
    const EncryptedEnvelope e = sample();

    check(canonical_envelope_bytes(e) == kExpectedCanonical, "canonical_bytes", canonical_envelope_bytes(e));
    check(envelope_blob_hash(e) == kExpectedHash, "frozen_hash", envelope_blob_hash(e));

    {
        EncryptedEnvelope padded = e;
        padded.iv = "  " + padded.iv + "\n";
        padded.ciphertext = "\t" + padded.ciphertext + " ";
        padded.alg = " A256GCM ";
        check(envelope_blob_hash(padded) == kExpectedHash, "whitespace_trimmed");
    }

    {
        EncryptedEnvelope other = e;
        other.ciphertext.back() = (other.ciphertext.back() == 'Q') ? 'R' : 'Q';
        check(envelope_blob_hash(other) != kExpectedHash, "payload_change_changes_hash");
    }

    {
        json j = {{"version", 1}, {"alg", "A256GCM"}, {"iv", kIv}, {"ciphertext", kCt}};
        check(envelope_from_json(j) == e, "from_json");
        check(envelope_to_json(e) == j, "to_json");
    }

    check(rejects([&] { EncryptedEnvelope x = e; x.alg = "A128GCM"; envelope_blob_hash(x); }), "reject_alg");
    check(rejects([&] { EncryptedEnvelope x = e; x.version = 2; envelope_blob_hash(x); }), "reject_version");
    check(rejects([&] { EncryptedEnvelope x = e; x.iv = "AAECAwQFBgc+CQoL"; envelope_blob_hash(x); }), "reject_iv_alphabet");
    check(rejects([&] { EncryptedEnvelope x = e; x.iv = "AAECAwQFBgc"; envelope_blob_hash(x); }), "reject_iv_short");
    check(rejects([&] { EncryptedEnvelope x = e; x.iv = std::string(41, 'A'); envelope_blob_hash(x); }), "reject_iv_long");
    check(rejects([&] { EncryptedEnvelope x = e; x.ciphertext = "c2VjcmV0"; envelope_blob_hash(x); }), "reject_ct_short");
    check(rejects([&] { EncryptedEnvelope x = e; x.ciphertext = "   "; envelope_blob_hash(x); }), "reject_ct_empty");
    check(rejects([&] { envelope_from_json(json{{"version", 1}, {"alg", "A256GCM"}, {"iv", kIv}}); }),
          "reject_missing_ciphertext");
    check(rejects([&] { envelope_from_json(json{{"version", 1}, {"alg", "A256GCM"}, {"iv", 12}, {"ciphertext", kCt}}); }),
          "reject_iv_type");
    check(rejects([&] { envelope_from_json(json::array()); }), "reject_not_object");
    check(rejects([&] { envelope_from_json(json{{"version", 4294967297LL}, {"alg", "A256GCM"}, {"iv", kIv}, {"ciphertext", kCt}}); }),
          "reject_wide_version");
    check(rejects([&] { envelope_from_json(json{{"version", 18446744073709551615ULL}, {"alg", "A256GCM"}, {"iv", kIv}, {"ciphertext", kCt}}); }),
          "reject_unsigned_version");

    // --- blob record codec ---
    {
        EncryptedBlobV2 b;
        b.encrypted = e;
        b.checksum = kExpectedHash;
        BlobRecord rec = parse_blob_record(serialize_blob_record(b));
        bool ok = std::holds_alternative<EncryptedBlobV2>(rec) &&
                  std::get<EncryptedBlobV2>(rec).encrypted == e &&
                  std::get<EncryptedBlobV2>(rec).checksum == kExpectedHash;
        check(ok, "blob_record_v2");
    }
    {
        json j = {{"version", 2}, {"encrypted", envelope_to_json(e)}, {"checksum", "  682942206660CDEEB44170737C728C1C16A9023317814EF3A03A640FAD68643A "}};
        BlobRecord rec = parse_blob_record(j.dump());
        check(std::holds_alternative<EncryptedBlobV2>(rec) && std::get<EncryptedBlobV2>(rec).checksum == kExpectedHash,
              "blob_record_checksum_normalized");
    }
    {
        json j = {{"version", 1}, {"playlist", {{"name", "road trip"}, {"tracks", json::array()}}}};
        check(std::holds_alternative<LegacyPlaintextBlob>(parse_blob_record(j.dump())), "blob_record_legacy");
    }
    check(rejects([&] { parse_blob_record(json{{"version", 3}}.dump()); }), "blob_record_unknown_version");
    check(rejects([&] { parse_blob_record("{not json"); }), "blob_record_garbage");
    check(rejects([&] { parse_blob_record(json{{"version", 2}}.dump()); }), "blob_record_no_envelope");
    {
        // versions that collapse to 1 or 2 when cut to 32 bits
        json legacy_wide = {{"version", 4294967297LL}, {"playlist", json::object()}};
        check(rejects([&] { parse_blob_record(legacy_wide.dump()); }), "blob_record_wide_legacy_version");
        json v2_wide = {{"version", 4294967298LL}, {"encrypted", envelope_to_json(e)}};
        check(rejects([&] { parse_blob_record(v2_wide.dump()); }), "blob_record_wide_v2_version");
    }

    if (failures) {
        std::fprintf(stderr, "[envelope] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[envelope] ALL OK\n");
    return 0;
}

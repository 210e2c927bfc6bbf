// tests/blobs/test_blob_store.cpp
//
// Content-addressed blob files: write-once put, verified get, corruption
// detection, idempotent remove.

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <nlohmann/json.hpp>
#include <sodium.h>

#include "atomic_file.h"
#include "blob_store.h"
#include "envelope.h"
#include "gzip_codec.h"
#include "plshare_util.h"
#include "store_error.h"

namespace fs = std::filesystem;
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

static std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

static void spit(const fs::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(s.data(), (std::streamsize)s.size());
}

static bool get_throws(const BlobStore& bs, const std::string& h, StoreErrc want) {
    try {
        bs.get(h);
        return false;
    } catch (const StoreError& e) {
        return e.code() == want;
    }
}

static EncryptedEnvelope make_env(const std::string& ct) {
    EncryptedEnvelope e;
    e.iv = "AAECAwQFBgcICQoL";
    e.ciphertext = ct;
    return e;
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 1;
    }

    const fs::path root = fs::temp_directory_path() / ("plshare_blobs_" + random_b64url(6));
    BlobStore bs(root);

    const EncryptedEnvelope env = make_env("c2VjcmV0LXBsYXlsaXN0LWNpcGhlcnRleHQ");
    const std::string h = envelope_blob_hash(env);

    // --- layout ---
    {
        fs::path want = root / "blobs" / h.substr(0, 2) / h.substr(2, 2) / (h + ".json.gz");
        check(bs.path_for(h) == want, "path_layout", bs.path_for(h).string());
    }

    // --- put / get ---
    check(!bs.exists(h), "absent_before_put");
    check(bs.put(h, env), "put_creates");
    check(!bs.put(h, env), "put_dedups");
    check(bs.exists(h), "exists_after_put");

    {
        BlobReadResult r = bs.get(h);
        check(!r.legacy_plaintext && r.envelope == env, "get_roundtrip");
    }

    // file body is gzip of {version:2, encrypted, checksum}
    {
        std::string raw;
        std::string err;
        check(gzip_decompress(slurp(bs.path_for(h)), &raw, &err), "file_is_gzip", err);
        json j = json::parse(raw, nullptr, false);
        check(j.is_object() && j.value("version", 0) == 2 && j.value("checksum", "") == h, "file_body_shape", raw);
    }

    // --- hash / envelope mismatch refused at write ---
    {
        bool threw = false;
        try {
            bs.put(std::string(64, 'a'), env);
        } catch (const StoreError& e) {
            threw = (e.code() == StoreErrc::validation);
        }
        check(threw, "put_wrong_address_rejected");
    }
    {
        bool threw = false;
        try {
            bs.exists("NOT-A-HASH");
        } catch (const StoreError& e) {
            threw = (e.code() == StoreErrc::validation);
        }
        check(threw, "bad_hash_validation");
    }

    // --- every single-byte corruption is detected ---
    {
        const fs::path p = bs.path_for(h);
        const std::string original = slurp(p);
        size_t undetected = 0;
        size_t first_undetected = 0;
        for (size_t i = 0; i < original.size(); i++) {
            std::string bad = original;
            bad[i] = (char)(bad[i] ^ 0xFF);
            spit(p, bad);
            if (!get_throws(bs, h, StoreErrc::integrity)) {
                if (!undetected) first_undetected = i;
                undetected++;
            }
        }
        spit(p, original);
        check(undetected == 0, "byte_flip_detected",
              "undetected=" + std::to_string(undetected) + " first=" + std::to_string(first_undetected));

        // truncation and trailing garbage
        spit(p, original.substr(0, original.size() - 1));
        check(get_throws(bs, h, StoreErrc::integrity), "truncation_detected");
        spit(p, original + "x");
        check(get_throws(bs, h, StoreErrc::integrity), "trailing_bytes_detected");

        spit(p, original);
        check(bs.get(h).envelope == env, "restored_reads_again");
    }

    // --- a valid blob stored at the wrong address ---
    {
        const EncryptedEnvelope other = make_env("b3RoZXItcGxheWxpc3QtY2lwaGVydGV4dA");
        const std::string oh = envelope_blob_hash(other);
        check(bs.put(oh, other), "put_other");
        const fs::path op = bs.path_for(oh);
        spit(op, slurp(bs.path_for(h)));
        check(get_throws(bs, oh, StoreErrc::integrity), "misplaced_blob_detected");
        check(bs.remove(oh), "remove_misplaced");
    }

    // --- legacy plaintext body ---
    {
        const std::string lh = std::string(62, '0') + "ab";
        json legacy = {{"version", 1}, {"playlist", {{"name", "old"}}}};
        std::string gz;
        std::string err;
        check(gzip_compress(legacy.dump(), &gz, &err), "legacy_compress", err);
        fs::create_directories(bs.path_for(lh).parent_path());
        spit(bs.path_for(lh), gz);
        BlobReadResult r = bs.get(lh);
        check(r.legacy_plaintext, "legacy_flagged");
        check(bs.remove(lh), "remove_legacy");
    }

    // --- unknown or incomplete bodies are corruption, not legacy ---
    {
        const std::string uh = std::string(62, '0') + "cd";
        const json bodies[] = {
            json{{"version", 3}, {"playlist", {{"name", "future"}}}},
            json{{"version", 2}, {"checksum", uh}},
        };
        const char* names[] = {"unknown_version_is_integrity", "v2_without_envelope_is_integrity"};
        for (size_t i = 0; i < 2; ++i) {
            std::string gz;
            std::string err;
            check(gzip_compress(bodies[i].dump(), &gz, &err), "odd_body_compress", err);
            fs::create_directories(bs.path_for(uh).parent_path());
            spit(bs.path_for(uh), gz);
            check(get_throws(bs, uh, StoreErrc::integrity), names[i]);
        }
        check(bs.remove(uh), "remove_odd_body");
    }

    // --- missing ---
    {
        const std::string mh = std::string(64, 'f');
        check(get_throws(bs, mh, StoreErrc::integrity), "missing_is_integrity");
    }

    // --- listing skips temp files and strays ---
    {
        const fs::path shard = bs.path_for(h).parent_path();
        spit(shard / "stray.txt", "x");
        spit(temp_path_for(bs.path_for(h)), "partial");
        auto hs = bs.list_hashes();
        check(hs.size() == 1 && hs[0] == h, "list_hashes", std::to_string(hs.size()));
    }

    // --- remove ---
    check(bs.remove(h), "remove_present");
    check(!bs.remove(h), "remove_absent");
    check(!bs.exists(h), "absent_after_remove");

    std::error_code ec;
    fs::remove_all(root, ec);

    if (failures) {
        std::fprintf(stderr, "[blob_store] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[blob_store] ALL OK\n");
    return 0;
}

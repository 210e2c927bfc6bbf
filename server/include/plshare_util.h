#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace plshare {

    long now_epoch();
    std::int64_t now_epoch_ms();

    // ISO-8601 UTC with milliseconds: "YYYY-MM-DDTHH:MM:SS.mmmZ"
    std::string now_iso_utc();

    // Strict parse of "YYYY-MM-DDTHH:MM:SSZ" or "YYYY-MM-DDTHH:MM:SS.mmmZ".
    // On success writes the normalized millisecond form to *normalized.
    bool parse_iso_utc(const std::string& s, std::string* normalized);

    std::string lower_ascii(std::string s);
    std::string trim_ascii(const std::string& s);

    // --- hashing ---
    std::array<unsigned char, 32> sha256_bytes(const std::string& s);
    std::string sha256_hex(const std::string& s);
    std::string to_hex(const unsigned char* p, size_t n);
    bool from_hex(const std::string& hex, std::vector<unsigned char>* out);

    // lowercase hex SHA-256 digest (64 chars)
    bool is_sha256_hex(const std::string& s);

    // --- base64url (no padding) ---
    std::string b64url_enc(const unsigned char* data, size_t len);
    bool is_b64url_alphabet(const std::string& s);

    // n random bytes from libsodium, base64url encoded
    std::string random_b64url(size_t nbytes);

    // Public share id: [A-Za-z0-9_-]{16,64}
    bool is_share_id(const std::string& s);

} // namespace plshare

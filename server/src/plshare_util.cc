#include "plshare_util.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>
#include <sodium.h>

namespace plshare {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::int64_t now_epoch_ms() {
    using namespace std::chrono;
    return (std::int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

/*
parse_iso_utc()
  - Accepts exactly "YYYY-MM-DDTHH:MM:SSZ" or "YYYY-MM-DDTHH:MM:SS.mmmZ".
  - No offsets, no other fraction widths.
  - Field ranges are checked, and the date is round-tripped through timegm()
    so that e.g. Feb 30 is rejected.
*/
bool parse_iso_utc(const std::string& s, std::string* normalized) {
    const bool with_ms = (s.size() == 24);
    if (s.size() != 20 && !with_ms) return false;
    if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':') return false;
    if (s.back() != 'Z') return false;
    if (with_ms && s[19] != '.') return false;

    auto to_int = [&](size_t a, size_t b, int* v) -> bool {
        int x = 0;
        for (size_t i = a; i < b; i++) {
            char c = s[i];
            if (c < '0' || c > '9') return false;
            x = x * 10 + (c - '0');
        }
        *v = x;
        return true;
    };

    int Y=0, M=0, D=0, h=0, m=0, se=0, ms=0;
    if (!to_int(0, 4, &Y)) return false;
    if (!to_int(5, 7, &M)) return false;
    if (!to_int(8, 10, &D)) return false;
    if (!to_int(11, 13, &h)) return false;
    if (!to_int(14, 16, &m)) return false;
    if (!to_int(17, 19, &se)) return false;
    if (with_ms && !to_int(20, 23, &ms)) return false;

    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || se > 60) return false;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon  = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min  = m;
    tm.tm_sec  = se;
    std::tm probe = tm;
    if (::timegm(&probe) == (std::time_t)-1) return false;
    if (probe.tm_mday != D || probe.tm_mon != M - 1) return false;

    if (normalized) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      Y, M, D, h, m, se, ms);
        *normalized = buf;
    }
    return true;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim_ascii(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) a++;
    while (b > a && std::isspace((unsigned char)s[b - 1])) b--;
    return s.substr(a, b - a);
}

std::array<unsigned char, 32> sha256_bytes(const std::string& s) {
    std::array<unsigned char, 32> h{};
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h.data());
    return h;
}

std::string sha256_hex(const std::string& s) {
    auto h = sha256_bytes(s);
    return to_hex(h.data(), h.size());
}

std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

bool from_hex(const std::string& hex, std::vector<unsigned char>* out) {
    if (!out || (hex.size() % 2) != 0) return false;
    auto nib = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    out->clear();
    out->reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nib(hex[i]);
        int lo = nib(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out->push_back((unsigned char)((hi << 4) | lo));
    }
    return true;
}

bool is_sha256_hex(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

std::string b64url_enc(const unsigned char* data, size_t len) {
    size_t outLen = sodium_base64_encoded_len(len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    out.resize(std::strlen(out.c_str()));
    return out;
}

bool is_b64url_alphabet(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum((unsigned char)c) || c == '-' || c == '_';
    });
}

std::string random_b64url(size_t nbytes) {
    std::vector<unsigned char> rnd(nbytes);
    randombytes_buf(rnd.data(), rnd.size());
    std::string out = b64url_enc(rnd.data(), rnd.size());
    sodium_memzero(rnd.data(), rnd.size());
    return out;
}

bool is_share_id(const std::string& s) {
    if (s.size() < 16 || s.size() > 64) return false;
    return is_b64url_alphabet(s);
}

} // namespace plshare

#pragma once
#include <cstddef>
#include <string>

namespace plshare {

// Upper bound for an inflated blob body. Envelopes cap ciphertext at 2,000,000
// chars, so anything far beyond that is not ours.
inline constexpr size_t kMaxInflatedBytes = 8u * 1024u * 1024u;

// gzip (RFC 1952) at level 9 with a fixed 10-byte header
// (mtime 0, no name/comment, OS 255), so output depends only on the input
// and the zlib build.
bool gzip_compress(const std::string& in, std::string* out, std::string* err);

// Strict inverse of gzip_compress():
//   - header must be byte-identical to the one gzip_compress() writes
//   - CRC32 + ISIZE trailer verified by zlib
//   - exactly one member, no trailing bytes
// so that any single-byte change in a stored file is reported as a failure.
bool gzip_decompress(const std::string& in, std::string* out, std::string* err,
                     size_t max_out = kMaxInflatedBytes);

} // namespace plshare

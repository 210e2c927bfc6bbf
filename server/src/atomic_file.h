#pragma once
#include <filesystem>
#include <string>

namespace plshare {

enum class CreateStatus {
    created,   // this call placed the file
    exists,    // destination already taken (not an error)
    failed,    // I/O failure, *err filled
};

// Write bytes to a same-directory temp file, then publish it with link(2),
// which fails if the destination exists. Never overwrites.
// Falls back to O_CREAT|O_EXCL on the destination when the filesystem
// refuses hard links.
CreateStatus create_unique_file(const std::filesystem::path& target,
                                const std::string& bytes,
                                std::string* err);

// Write bytes to a same-directory temp file, then rename(2) it over target.
bool replace_file_atomic(const std::filesystem::path& target,
                         const std::string& bytes,
                         std::string* err);

enum class ReadStatus {
    ok,
    missing,
    failed,
};

ReadStatus read_file_bytes(const std::filesystem::path& p,
                           std::string* out,
                           std::string* err);

// Remove a file. Missing is not an error: *removed tells whether this call
// deleted something.
bool remove_file_if_present(const std::filesystem::path& p,
                            bool* removed,
                            std::string* err);

// "<target>.<epoch_ms>.<12 hex>.tmp"
std::filesystem::path temp_path_for(const std::filesystem::path& target);

bool is_temp_path(const std::filesystem::path& p);

} // namespace plshare

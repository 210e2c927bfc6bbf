#pragma once
#include <stdexcept>
#include <string>

namespace plshare {

// Failure classes surfaced by the share store.
//
// validation : malformed envelope / id / hash / record (rejected before I/O,
//              or a corrupt on-disk record)
// collision  : share id retries exhausted
// integrity  : blob bytes do not hash to their address, or cannot be decoded
// quota      : write would exceed the configured soft limit
// io         : filesystem failure
enum class StoreErrc {
    validation,
    collision,
    integrity,
    quota,
    io,
};

inline const char* store_errc_str(StoreErrc c) {
    switch (c) {
        case StoreErrc::validation: return "validation";
        case StoreErrc::collision:  return "collision";
        case StoreErrc::integrity:  return "integrity";
        case StoreErrc::quota:      return "quota";
        case StoreErrc::io:         return "io";
    }
    return "unknown";
}

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    StoreErrc code() const { return code_; }

private:
    StoreErrc code_;
};

} // namespace plshare

#pragma once
#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace plshare {

// Ordering: DEBUG < INFO < SECURITY
enum class AuditLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    SECURITY = 2,
};

const char* audit_level_str(AuditLevel l);
bool parse_audit_level(const std::string& s, AuditLevel* out);

/*
AuditEvent
==========

One store event. All context fields are strings.

Conventions:
  event   : "<subsystem>.<action>"   e.g. "share.create", "blob.collect"
  outcome : "ok" | "fail" | "deny" | "skip"

IMPORTANT:
- Never put edit tokens (or anything derived from them other than the
  stored hash) into f.
- Share ids and blob hashes are identifiers, fine to log.
*/
struct AuditEvent {
    std::string ts_utc;   // filled by append() when empty
    std::string event;
    std::string outcome;
    AuditLevel level = AuditLevel::INFO;
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL audit log.

Each log line contains:
- prev_hash : line_hash of the previous line (64 zeros at genesis)
- line_hash : SHA-256(prev_hash + json_without_line_hash)

  H_i = SHA256( H_{i-1} || JSON_i_without_line_hash )

Any modification, insertion, deletion, or reordering of lines breaks the
chain from that point forward; verify() reports the first such line.

Tamper evidence only: whoever can rewrite both the JSONL file and the state
file can rewrite history.
*/
class AuditLog {
public:
    AuditLog(std::string jsonl_path, std::string state_path);

    // Thread-safe; appends are serialized to keep the chain linear.
    // Events below the minimum level are dropped.
    void append(const AuditEvent& e);

    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;
    bool enabled_for(AuditLevel l) const;

    const std::string& jsonl_path() const { return jsonl_path_; }

    struct VerifyResult {
        bool ok = false;
        size_t lines = 0;        // lines checked
        size_t first_bad_line = 0; // 1-based; 0 when ok
        std::string error;
        std::string last_hash;   // line_hash of the last good line
    };

    // Re-walks the chain of a JSONL file. A missing file is an empty,
    // valid chain.
    static VerifyResult verify(const std::string& jsonl_path);

private:
    std::atomic<int> min_level_{static_cast<int>(AuditLevel::INFO)};

    std::string jsonl_path_;
    std::string state_path_;

    std::mutex mu_;

    // 64 hex chars from the state file, or 64 zeros (genesis).
    std::string load_prev_hash_();
    bool store_prev_hash_(const std::string& h);

    static std::string json_escape_(const std::string& s);

    // Same bytes on append and on verify: fixed field order, f sorted by key.
    static std::string build_json_(const AuditEvent& e,
                                   const std::string& prev_hash,
                                   std::string* out_line_hash);
};

} // namespace plshare

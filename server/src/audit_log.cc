#include "audit_log.h"

#include "plshare_util.h"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace plshare {

/*
Audit log (hash-chained JSONL)
=============================

The share store records events that matter after the fact: who created which
share (by id, never by token), revocations and their outcome, blobs removed by
GC or the operator sweep, integrity failures, quota rejections.

Line format (fixed field order, f sorted by key):

  {"ts":"...","event":"...","outcome":"...","level":"INFO",
   "prev_hash":"<64 hex>","line_hash":"<64 hex>","f":{...}}

line_hash covers the same line with the line_hash member left out, prefixed
by prev_hash. verify() reparses each line, rebuilds those bytes and requires
both the hash and the full line to match, so added or reordered members are
caught as well as edited values.

Threading model
---------------
append() may be called from any HTTP worker. mu_ serializes the
read-state / write-line / write-state sequence.
*/

static const std::string kGenesisHash(64, '0');

const char* audit_level_str(AuditLevel l) {
  switch (l) {
    case AuditLevel::DEBUG:    return "DEBUG";
    case AuditLevel::INFO:     return "INFO";
    case AuditLevel::SECURITY: return "SECURITY";
  }
  return "INFO";
}

bool parse_audit_level(const std::string& s_in, AuditLevel* out) {
  std::string s = trim_ascii(s_in);
  for (char& c : s) c = (char)std::toupper((unsigned char)c);
  AuditLevel l;
  if (s == "DEBUG") l = AuditLevel::DEBUG;
  else if (s == "INFO") l = AuditLevel::INFO;
  else if (s == "SECURITY") l = AuditLevel::SECURITY;
  else return false;
  if (out) *out = l;
  return true;
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
  : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

bool AuditLog::set_min_level_str(const std::string& s) {
  AuditLevel l;
  if (!parse_audit_level(s, &l)) return false;
  min_level_.store(static_cast<int>(l));
  return true;
}

std::string AuditLog::min_level_str() const {
  return audit_level_str(static_cast<AuditLevel>(min_level_.load()));
}

bool AuditLog::enabled_for(AuditLevel l) const {
  return static_cast<int>(l) >= min_level_.load();
}

/*
Fail-safe behavior:
- Missing or invalid state file restarts the chain from the all-zero hash.
  verify() then flags the first line of the new segment, which is the
  desired signal: the state was lost or replaced.
*/
std::string AuditLog::load_prev_hash_() {
  std::ifstream f(state_path_);
  if (!f.good()) return kGenesisHash;
  std::string line;
  std::getline(f, line);
  line = trim_ascii(line);
  if (!is_sha256_hex(line)) return kGenesisHash;
  return line;
}

bool AuditLog::store_prev_hash_(const std::string& h) {
  std::ofstream f(state_path_, std::ios::trunc);
  f << h << "\n";
  f.flush();
  return f.good();
}

std::string AuditLog::json_escape_(const std::string& s) {
  std::ostringstream o;
  for (char c : s) {
    switch (c) {
      case '\"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\b': o << "\\b"; break;
      case '\f': o << "\\f"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << (int)(unsigned char)c << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

// line_hash == "" => member omitted (hash preimage form)
static std::string serialize_line(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  const std::string& line_hash,
                                  std::string (*esc)(const std::string&)) {
  std::ostringstream js;
  js << "{"
     << "\"ts\":\"" << esc(e.ts_utc) << "\""
     << ",\"event\":\"" << esc(e.event) << "\""
     << ",\"outcome\":\"" << esc(e.outcome) << "\""
     << ",\"level\":\"" << audit_level_str(e.level) << "\""
     << ",\"prev_hash\":\"" << prev_hash << "\"";
  if (!line_hash.empty()) js << ",\"line_hash\":\"" << line_hash << "\"";

  if (!e.f.empty()) {
    js << ",\"f\":{";
    bool first = true;
    for (const auto& kv : e.f) {
      if (!first) js << ",";
      first = false;
      js << "\"" << esc(kv.first) << "\":"
         << "\"" << esc(kv.second) << "\"";
    }
    js << "}";
  }
  js << "}";
  return js.str();
}

std::string AuditLog::build_json_(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  std::string* out_line_hash) {
  const std::string without = serialize_line(e, prev_hash, "", &AuditLog::json_escape_);
  *out_line_hash = sha256_hex(prev_hash + without);
  return serialize_line(e, prev_hash, *out_line_hash, &AuditLog::json_escape_);
}

void AuditLog::append(const AuditEvent& e_in) {
  if (!enabled_for(e_in.level)) return;

  std::lock_guard<std::mutex> lk(mu_);

  AuditEvent e = e_in;
  if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

  const std::string prev = load_prev_hash_();

  std::string line_hash;
  const std::string line = build_json_(e, prev, &line_hash);

  std::ofstream out(jsonl_path_, std::ios::app);
  out << line << "\n";
  out.flush();
  if (!out.good()) {
    std::cerr << "[audit] ERROR: append failed for " << jsonl_path_
              << " (event=" << e.event << ")" << std::endl;
    return; // chain not advanced
  }

  if (!store_prev_hash_(line_hash)) {
    std::cerr << "[audit] ERROR: state update failed for " << state_path_ << std::endl;
  }
}

AuditLog::VerifyResult AuditLog::verify(const std::string& jsonl_path) {
  VerifyResult r;
  r.last_hash = kGenesisHash;

  std::ifstream in(jsonl_path);
  if (!in.good()) {
    r.ok = true; // nothing logged yet
    return r;
  }

  auto fail = [&](size_t n, const std::string& why) {
    r.ok = false;
    r.first_bad_line = n;
    r.error = why;
    return r;
  };

  std::string line;
  size_t n = 0;
  while (std::getline(in, line)) {
    n++;
    if (line.empty()) {
      if (in.peek() == std::char_traits<char>::eof()) break; // trailing newline
      return fail(n, "empty line");
    }

    json j;
    try {
      j = json::parse(line);
    } catch (const std::exception& ex) {
      return fail(n, std::string("not json: ") + ex.what());
    }
    if (!j.is_object()) return fail(n, "not an object");

    auto str = [&](const char* k, std::string* out) -> bool {
      auto it = j.find(k);
      if (it == j.end() || !it->is_string()) return false;
      *out = it->get<std::string>();
      return true;
    };

    AuditEvent e;
    std::string lvl, prev, lh;
    if (!str("ts", &e.ts_utc) || !str("event", &e.event) || !str("outcome", &e.outcome) ||
        !str("level", &lvl) || !str("prev_hash", &prev) || !str("line_hash", &lh)) {
      return fail(n, "missing member");
    }
    if (!parse_audit_level(lvl, &e.level)) return fail(n, "bad level");

    auto fit = j.find("f");
    if (fit != j.end()) {
      if (!fit->is_object()) return fail(n, "f is not an object");
      for (auto it = fit->begin(); it != fit->end(); ++it) {
        if (!it.value().is_string()) return fail(n, "f value is not a string");
        e.f[it.key()] = it.value().get<std::string>();
      }
    }

    if (prev != r.last_hash) return fail(n, "prev_hash does not continue the chain");

    std::string expect_hash;
    const std::string rebuilt = build_json_(e, prev, &expect_hash);
    if (expect_hash != lh) return fail(n, "line_hash mismatch");
    if (rebuilt != line) return fail(n, "line is not in canonical form");

    r.last_hash = lh;
    r.lines = n;
  }

  r.ok = true;
  return r;
}

} // namespace plshare

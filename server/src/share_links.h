#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace plshare {

// Minimum accepted length of a presented edit token (after trimming).
inline constexpr size_t kMinEditTokenLen = 16;
// Random bytes behind a generated edit token (32 base64url chars).
inline constexpr size_t kEditTokenBytes = 24;

struct ShareLink {
    std::string share_id;
    std::string content_hash;    // lowercase sha256 hex
    std::string blob_hash;       // "" in older records => content_hash is the address
    std::string created_at;      // ISO8601 UTC with millis
    bool revoked = false;
    bool encrypted = true;
    std::string edit_token_hash; // "" => not revocable

    const std::string& effective_blob_hash() const {
        return blob_hash.empty() ? content_hash : blob_hash;
    }
    bool revocable() const { return !edit_token_hash.empty(); }
};

struct LinkCreateResult {
    bool created = false;                  // false => share id already taken
    std::optional<std::string> edit_token; // plaintext, only when created && revocable
    ShareLink link;
};

// sha256 hex of the trimmed token
std::string hash_edit_token(const std::string& token);

/*
LinkStore
  One JSON file per public share id:

    <root>/links/<shareId>.json
      {version:1, shareId, contentHash, blobHash, createdAt, revoked,
       encrypted:true, editTokenHash?}

  - create() never overwrites: publication goes through create_unique_file()
    and an existing file means "id taken", so the caller picks another id.
  - mark_revoked() is the only mutation; it replaces the file atomically.
  - No in-process lock: link(2)/rename(2) are the synchronization points, so
    several processes may share one root.

Errors are StoreError (validation for malformed records, io otherwise).
*/
class LinkStore {
public:
    explicit LinkStore(std::filesystem::path root);

    const std::filesystem::path& links_dir() const { return links_dir_; }
    std::filesystem::path path_for(const std::string& share_id) const;

    LinkCreateResult create(const std::string& share_id,
                            const std::string& content_hash,
                            const std::string& blob_hash,
                            bool revocable);

    // std::nullopt for a malformed id or a missing file.
    std::optional<ShareLink> get(const std::string& share_id) const;

    // Same as get() but by file path (GC / report scans).
    std::optional<ShareLink> read_path(const std::filesystem::path& p) const;

    void mark_revoked(const ShareLink& link);

    // <root>/links/*.json; missing dir => empty
    std::vector<std::filesystem::path> list_paths() const;

    static std::string serialize(const ShareLink& link);
    static ShareLink parse(const std::string& text);

    // Upper bound of a serialized record's size, for quota estimates.
    static size_t estimate_record_bytes(bool revocable);

private:
    std::filesystem::path links_dir_;
};

} // namespace plshare

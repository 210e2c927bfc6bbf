#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace plshare {

/*
RateLimiter
  Sliding-window counter per key: at most max_events accepted events in any
  window_ms interval. A rejected call does not consume a slot.

  Owned by main() and handed to the routes; one instance per policy
  (per-client creates, global writes). Use key "" for a global window.
*/
class RateLimiter {
public:
    RateLimiter(size_t max_events, std::int64_t window_ms);

    bool allow(const std::string& key);
    bool allow(const std::string& key, std::int64_t now_ms);

    size_t tracked_keys() const;

private:
    // Keys beyond this trigger a prune of idle windows.
    static constexpr size_t kPruneThreshold = 5000;

    size_t max_events_;
    std::int64_t window_ms_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::deque<std::int64_t>> windows_;

    void prune_locked(std::int64_t window_start);
};

} // namespace plshare

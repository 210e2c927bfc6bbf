#include "rate_limiter.h"

#include "plshare_util.h"

namespace plshare {

RateLimiter::RateLimiter(size_t max_events, std::int64_t window_ms)
    : max_events_(max_events), window_ms_(window_ms) {}

bool RateLimiter::allow(const std::string& key) {
    return allow(key, now_epoch_ms());
}

bool RateLimiter::allow(const std::string& key, std::int64_t now_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::int64_t window_start = now_ms - window_ms_;

    auto& q = windows_[key];
    while (!q.empty() && q.front() <= window_start) q.pop_front();

    if (q.size() >= max_events_) return false;
    q.push_back(now_ms);

    if (windows_.size() > kPruneThreshold) prune_locked(window_start);
    return true;
}

void RateLimiter::prune_locked(std::int64_t window_start) {
    for (auto it = windows_.begin(); it != windows_.end();) {
        auto& q = it->second;
        while (!q.empty() && q.front() <= window_start) q.pop_front();
        if (q.empty()) it = windows_.erase(it);
        else ++it;
    }
}

size_t RateLimiter::tracked_keys() const {
    std::lock_guard<std::mutex> lk(mu_);
    return windows_.size();
}

} // namespace plshare

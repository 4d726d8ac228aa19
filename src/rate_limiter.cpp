#include "arbiter/rate_limiter.hpp"
#include <algorithm>

namespace arbiter
{
    RateLimiter::RateLimiter() : cfg_{} {}

    RateLimiter::RateLimiter(const Config &cfg) : cfg_(cfg) {}

    void RateLimiter::refill(Bucket &bucket, TimePoint now) const
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - bucket.last_refill).count();
        if (elapsed <= 0)
            return;
        bucket.tokens = std::min(cfg_.burst_capacity, bucket.tokens + elapsed * cfg_.tokens_per_second);
        bucket.last_refill = now;
    }

    void RateLimiter::evict_idle(TimePoint now)
    {
        std::erase_if(buckets_, [&](const auto &entry)
                      { return now - entry.second.last_refill > cfg_.idle_ttl; });
    }

    bool RateLimiter::allow(const std::string &key)
    {
        return allow(key, std::chrono::steady_clock::now());
    }

    bool RateLimiter::allow(const std::string &key, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto it = buckets_.find(key);
        if (it == buckets_.end())
        {
            if (buckets_.size() >= cfg_.max_tracked)
                evict_idle(now);
            it = buckets_.emplace(key, Bucket{cfg_.burst_capacity, now}).first;
        }
        else
        {
            refill(it->second, now);
        }

        if (it->second.tokens < 1.0)
            return false;
        it->second.tokens -= 1.0;
        return true;
    }

    std::size_t RateLimiter::tracked() const
    {
        std::lock_guard lock(mutex_);
        return buckets_.size();
    }

} // namespace arbiter

#pragma once

#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace arbiter
{
    /**
     * Thread-safe token-bucket rate limiter keyed by client identifier.
     * Buckets idle longer than idle_ttl are dropped once more than max_tracked
     * clients are known.
     */
    class RateLimiter
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;

        struct Config
        {
            double tokens_per_second{10.0};
            double burst_capacity{60.0};
            std::size_t max_tracked{10000};
            std::chrono::seconds idle_ttl{300};
        };

        RateLimiter();
        explicit RateLimiter(const Config &cfg);

        /** Returns true if a token is available for the given key. */
        bool allow(const std::string &key);

        /** Same as allow() at an explicit instant */
        bool allow(const std::string &key, TimePoint now);

        std::size_t tracked() const;

    private:
        struct Bucket
        {
            double tokens{0.0};
            TimePoint last_refill{};
        };

        void refill(Bucket &bucket, TimePoint now) const;

        void evict_idle(TimePoint now);

        Config cfg_;
        std::unordered_map<std::string, Bucket> buckets_;
        mutable std::mutex mutex_;
    };
}

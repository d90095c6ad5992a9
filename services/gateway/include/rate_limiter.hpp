#pragma once
#include <chrono>
#include <mutex>

// Token bucket shared by all accepts; one token per connection.
class ConnectionRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // per_second <= 0 disables limiting.
    explicit ConnectionRateLimiter(double per_second, double burst = 0);

    bool try_acquire();
    bool try_acquire(Clock::time_point now);

private:
    std::mutex mtx_;
    double rate_;
    double capacity_;
    double tokens_;
    Clock::time_point last_;
    bool started_{false};
};

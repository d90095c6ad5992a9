#include "../include/rate_limiter.hpp"
#include <algorithm>

ConnectionRateLimiter::ConnectionRateLimiter(double per_second, double burst)
    : rate_(per_second), capacity_(std::max(1.0, burst > 0 ? burst : per_second)), tokens_(capacity_) {}

bool ConnectionRateLimiter::try_acquire() {
    return try_acquire(Clock::now());
}

bool ConnectionRateLimiter::try_acquire(Clock::time_point now) {
    if (rate_ <= 0) return true;
    std::lock_guard<std::mutex> lock(mtx_);
    if (started_ && now > last_) {
        double elapsed = std::chrono::duration<double>(now - last_).count();
        tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);
    }
    if (!started_ || now > last_) last_ = now;
    started_ = true;
    if (tokens_ < 1.0) return false;
    tokens_ -= 1.0;
    return true;
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace scribe::core {

// Exponential delay: base * 2^(failures - 1), capped.
class Backoff {
public:
    Backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap) noexcept
        : base_(base)
        , cap_(std::max(cap, base)) {}

    // A server hint (Retry-After) wins when it is longer than the computed delay.
    [[nodiscard]] std::chrono::milliseconds
    delay(std::uint32_t failures,
          std::chrono::milliseconds suggested = std::chrono::milliseconds::zero()) const noexcept {
        if (failures == 0) {
            return std::chrono::milliseconds::zero();
        }

        auto d = base_;
        for (std::uint32_t i = 1; i < failures && d < cap_; ++i) {
            d *= 2;
        }
        d = std::min(d, cap_);

        return std::max(d, suggested);
    }

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds cap() const noexcept { return cap_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
};

// Sleep until `deadline` or until a stop is requested.
// Returns false when woken by the stop request.
inline bool sleep_until(std::chrono::steady_clock::time_point deadline, std::stop_token stoken) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    (void)cv.wait_until(lock, stoken, deadline, [] { return false; });
    return !stoken.stop_requested();
}

inline bool sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) {
    return sleep_until(std::chrono::steady_clock::now() + duration, std::move(stoken));
}

} // namespace scribe::core

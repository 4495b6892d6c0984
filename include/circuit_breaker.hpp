#pragma once

#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <string_view>

namespace rproxy {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string_view to_string(CircuitState state);

// Fault isolation around one dependency.
//
//   Closed   -> Open      failure count reaches failure_threshold
//   Open     -> HalfOpen  first call after timeout has elapsed since the last failure
//   HalfOpen -> Open      any failure
//   HalfOpen -> Closed    success_threshold successes; failure count reset to 0
//
// The failure count only resets on HalfOpen -> Closed. Open -> HalfOpen is
// decided lazily inside call(), there is no timer.
//
// Thread-safety: state transitions happen under state_mutex_, the wrapped
// call runs outside it. Several callers may probe concurrently in HalfOpen.
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using Call = std::function<std::expected<void, Error>()>;

    CircuitBreaker(int64_t failure_threshold, int64_t success_threshold,
                   std::chrono::milliseconds timeout);

    // Runs fn unless the breaker is open; CircuitOpen without calling fn otherwise
    std::expected<void, Error> call(const Call& fn);

    CircuitState state() const;

    int64_t failure_count() const { return failure_count_.load(); }
    int64_t success_count() const { return success_count_.load(); }

private:
    bool admit();
    void on_success();
    void on_failure();

    const int64_t failure_threshold_;
    const int64_t success_threshold_;
    const std::chrono::milliseconds timeout_;

    mutable std::mutex state_mutex_;
    CircuitState state_ = CircuitState::Closed;
    Clock::time_point last_failure_;

    std::atomic<int64_t> failure_count_{0};
    std::atomic<int64_t> success_count_{0};
};

} // namespace rproxy

#include "circuit_breaker.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace rproxy {

std::string_view to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half-open";
        default: return "unknown";
    }
}

CircuitBreaker::CircuitBreaker(int64_t failure_threshold, int64_t success_threshold,
                               std::chrono::milliseconds timeout)
    : failure_threshold_(failure_threshold),
      success_threshold_(success_threshold),
      timeout_(timeout) {}

std::expected<void, Error> CircuitBreaker::call(const Call& fn) {
    if (!admit()) {
        return std::unexpected(Error{ErrorCode::CircuitOpen, std::string(to_string(ErrorCode::CircuitOpen))});
    }

    auto result = fn();
    if (!result.has_value()) {
        on_failure();
        return result;
    }

    on_success();
    return {};
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool CircuitBreaker::admit() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != CircuitState::Open) {
        return true;
    }

    if (Clock::now() - last_failure_ > timeout_) {
        state_ = CircuitState::HalfOpen;
        success_count_.store(0);
        Logger::info(Logger::Component::Backend, "Circuit breaker open → half-open");
        return true;
    }
    return false;
}

void CircuitBreaker::on_success() {
    int64_t successes = success_count_.fetch_add(1) + 1;

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == CircuitState::HalfOpen && successes >= success_threshold_) {
        state_ = CircuitState::Closed;
        failure_count_.store(0);
        Logger::info(Logger::Component::Backend, "Circuit breaker half-open → closed");
    }
}

void CircuitBreaker::on_failure() {
    int64_t failures = failure_count_.fetch_add(1) + 1;

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_failure_ = Clock::now();
    if (state_ == CircuitState::HalfOpen ||
        (state_ == CircuitState::Closed && failures >= failure_threshold_)) {
        Logger::warn(Logger::Component::Backend,
            fmt::format("Circuit breaker {} → open after {} failures", to_string(state_), failures));
        state_ = CircuitState::Open;
    }
}

} // namespace rproxy

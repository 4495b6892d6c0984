#include "event_bus.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace rproxy {

EventBus::EventBus(size_t dispatchers) {
    if (dispatchers == 0) {
        dispatchers = 1;
    }
    dispatchers_.reserve(dispatchers);
    for (size_t i = 0; i < dispatchers; ++i) {
        dispatchers_.emplace_back([this](std::stop_token stop_token) {
            dispatch_loop(stop_token);
        });
    }
}

EventBus::~EventBus() {
    shutdown();
}

void EventBus::subscribe(const std::string& type, Handler handler) {
    auto entry = std::make_shared<const Handler>(std::move(handler));
    std::unique_lock lock(handlers_mutex_);
    handlers_[type].push_back(std::move(entry));
}

void EventBus::emit(Event event) {
    std::vector<std::shared_ptr<const Handler>> handlers;
    {
        std::shared_lock lock(handlers_mutex_);
        auto it = handlers_.find(event.type);
        if (it == handlers_.end() || it->second.empty()) {
            return;
        }
        handlers = it->second;
    }

    auto shared_event = std::make_shared<const Event>(std::move(event));
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (auto& handler : handlers) {
            queue_.emplace_back([handler, shared_event]() {
                (*handler)(*shared_event);
            });
        }
    }
    queue_cv_.notify_all();
}

size_t EventBus::subscriber_count(const std::string& type) const {
    std::shared_lock lock(handlers_mutex_);
    auto it = handlers_.find(type);
    return it == handlers_.end() ? 0 : it->second.size();
}

void EventBus::shutdown() {
    for (auto& dispatcher : dispatchers_) {
        dispatcher.request_stop();
    }
    for (auto& dispatcher : dispatchers_) {
        if (dispatcher.joinable()) {
            dispatcher.join();
        }
    }
    dispatchers_.clear();
}

void EventBus::dispatch_loop(std::stop_token stop_token) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            // Returns early on stop; whatever is still queued gets drained
            if (!queue_cv_.wait(lock, stop_token, [this] { return !queue_.empty(); })) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(Logger::Component::Events,
                fmt::format("Event handler threw: {}", e.what()));
        }
    }
}

} // namespace rproxy

#include "ab_test_manager.hpp"
#include "logger.hpp"
#include "request_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <mutex>

namespace rproxy {

void ABTestManager::add_test(const std::string& name, std::shared_ptr<Pool> variant_a,
                             std::shared_ptr<Pool> variant_b, double split_percent) {
    auto test = std::make_shared<ABTest>();
    test->name = name;
    test->variant_a = std::move(variant_a);
    test->variant_b = std::move(variant_b);
    test->split_percent = std::clamp(split_percent, 0.0, 100.0);

    std::unique_lock lock(mutex_);
    tests_[name] = std::move(test);

    Logger::info(Logger::Component::Traffic,
        fmt::format("A/B test '{}' registered, {}% to variant B", name, split_percent));
}

bool ABTestManager::has_test(const std::string& name) const {
    return find(name) != nullptr;
}

std::optional<VariantChoice> ABTestManager::select_variant(const std::string& name, const httplib::Request& req) {
    auto test = find(name);
    if (!test) {
        return std::nullopt;
    }

    Variant variant = variant_for(*test, routing_identifier(req));
    if (variant == Variant::B) {
        test->requests_b.fetch_add(1);
        return VariantChoice{Variant::B, test->variant_b};
    }

    test->requests_a.fetch_add(1);
    return VariantChoice{Variant::A, test->variant_a};
}

std::optional<Variant> ABTestManager::assign(const std::string& name, const std::string& identifier) const {
    auto test = find(name);
    if (!test) {
        return std::nullopt;
    }
    return variant_for(*test, identifier);
}

void ABTestManager::record_success(const std::string& name, Variant variant) {
    auto test = find(name);
    if (!test) {
        return;
    }
    (variant == Variant::B ? test->success_b : test->success_a).fetch_add(1);
}

void ABTestManager::record_error(const std::string& name, Variant variant) {
    auto test = find(name);
    if (!test) {
        return;
    }
    (variant == Variant::B ? test->errors_b : test->errors_a).fetch_add(1);
}

std::optional<ABTestStats> ABTestManager::get_stats(const std::string& name) const {
    auto test = find(name);
    if (!test) {
        return std::nullopt;
    }

    ABTestStats stats;
    stats.requests_a = test->requests_a.load();
    stats.requests_b = test->requests_b.load();
    stats.success_a = test->success_a.load();
    stats.success_b = test->success_b.load();
    stats.errors_a = test->errors_a.load();
    stats.errors_b = test->errors_b.load();

    if (stats.requests_a > 0) {
        stats.success_rate_a = static_cast<double>(stats.success_a) / stats.requests_a;
        stats.error_rate_a = static_cast<double>(stats.errors_a) / stats.requests_a;
    }
    if (stats.requests_b > 0) {
        stats.success_rate_b = static_cast<double>(stats.success_b) / stats.requests_b;
        stats.error_rate_b = static_cast<double>(stats.errors_b) / stats.requests_b;
    }

    return stats;
}

std::shared_ptr<ABTestManager::ABTest> ABTestManager::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = tests_.find(name);
    if (it == tests_.end()) {
        return nullptr;
    }
    return it->second;
}

Variant ABTestManager::variant_for(const ABTest& test, const std::string& identifier) {
    // Integer truncation of the split, as a percentage threshold
    return bucket_of(identifier) < static_cast<int64_t>(test.split_percent) ? Variant::B : Variant::A;
}

} // namespace rproxy

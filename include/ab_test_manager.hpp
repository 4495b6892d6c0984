#pragma once

#include "backend_pool.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace rproxy {

enum class Variant {
    A,
    B
};

struct ABTestStats {
    int64_t requests_a = 0;
    int64_t requests_b = 0;
    int64_t success_a = 0;
    int64_t success_b = 0;
    int64_t errors_a = 0;
    int64_t errors_b = 0;
    double success_rate_a = 0.0;
    double success_rate_b = 0.0;
    double error_rate_a = 0.0;
    double error_rate_b = 0.0;
};

struct VariantChoice {
    Variant variant;
    std::shared_ptr<Pool> pool;
};

// Sticky A/B split. A request's routing identifier hashes into one of 100
// buckets; buckets below split_percent go to variant B.
class ABTestManager {
public:
    void add_test(const std::string& name, std::shared_ptr<Pool> variant_a,
                  std::shared_ptr<Pool> variant_b, double split_percent);

    bool has_test(const std::string& name) const;

    // std::nullopt for an unknown test
    std::optional<VariantChoice> select_variant(const std::string& name, const httplib::Request& req);

    // Variant for an identifier without counting a request
    std::optional<Variant> assign(const std::string& name, const std::string& identifier) const;

    void record_success(const std::string& name, Variant variant);
    void record_error(const std::string& name, Variant variant);

    // Counters plus rates computed at read time
    std::optional<ABTestStats> get_stats(const std::string& name) const;

private:
    struct ABTest {
        std::string name;
        std::shared_ptr<Pool> variant_a;
        std::shared_ptr<Pool> variant_b;
        double split_percent;
        std::atomic<int64_t> requests_a{0};
        std::atomic<int64_t> requests_b{0};
        std::atomic<int64_t> success_a{0};
        std::atomic<int64_t> success_b{0};
        std::atomic<int64_t> errors_a{0};
        std::atomic<int64_t> errors_b{0};
    };

    std::shared_ptr<ABTest> find(const std::string& name) const;
    static Variant variant_for(const ABTest& test, const std::string& identifier);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ABTest>> tests_;
};

} // namespace rproxy

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace notifctl {

// Counters and gauges rendered in the Prometheus text exposition format.
// Shared by the controller and every worker generation.
class metrics_registry {
public:
    using labels = std::map<std::string, std::string>;

    enum class metric_type { counter, gauge };

    // Register help text and type. Metrics used without describe() are
    // exposed as untyped.
    void describe(const std::string& name, const std::string& help, metric_type type);

    void increment(const std::string& name, const labels& l = {}, uint64_t delta = 1);
    void set_gauge(const std::string& name, double value, const labels& l = {});

    uint64_t counter_value(const std::string& name, const labels& l = {}) const;
    double gauge_value(const std::string& name, const labels& l = {}) const;

    std::string render() const;

private:
    struct family {
        std::string help;
        std::string type;
        std::map<labels, double> series;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, family> m_families;
};

using metrics_registry_sptr = std::shared_ptr<metrics_registry>;

} // namespace notifctl

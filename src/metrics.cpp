#include "metrics.hpp"
#include <spdlog/fmt/fmt.h>

namespace notifctl {

namespace {

std::string escape_label(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;
        }
    }
    return out;
}

std::string format_labels(const metrics_registry::labels& l) {
    if (l.empty()) return {};
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : l) {
        if (!first) out += ",";
        out += fmt::format("{}=\"{}\"", k, escape_label(v));
        first = false;
    }
    out += "}";
    return out;
}

} // anonymous namespace

void metrics_registry::describe(const std::string& name, const std::string& help,
                                metric_type type) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& fam = m_families[name];
    fam.help = help;
    fam.type = type == metric_type::counter ? "counter" : "gauge";
}

void metrics_registry::increment(const std::string& name, const labels& l, uint64_t delta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_families[name].series[l] += static_cast<double>(delta);
}

void metrics_registry::set_gauge(const std::string& name, double value, const labels& l) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_families[name].series[l] = value;
}

uint64_t metrics_registry::counter_value(const std::string& name, const labels& l) const {
    return static_cast<uint64_t>(gauge_value(name, l));
}

double metrics_registry::gauge_value(const std::string& name, const labels& l) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto fit = m_families.find(name);
    if (fit == m_families.end()) return 0;
    auto sit = fit->second.series.find(l);
    if (sit == fit->second.series.end()) return 0;
    return sit->second;
}

std::string metrics_registry::render() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string out;
    for (const auto& [name, fam] : m_families) {
        if (!fam.help.empty()) out += fmt::format("# HELP {} {}\n", name, fam.help);
        out += fmt::format("# TYPE {} {}\n", name, fam.type.empty() ? "untyped" : fam.type);
        for (const auto& [l, value] : fam.series) {
            out += fmt::format("{}{} {}\n", name, format_labels(l), value);
        }
    }
    return out;
}

} // namespace notifctl

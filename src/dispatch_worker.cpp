#include "dispatch_worker.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <set>
#include <thread>

namespace notifctl {

notification_request parse_notification_request(std::string_view json) {
    auto doc = nlohmann::json::parse(json);

    notification_request req;
    req.trigger = doc.at("trigger").get<std::string>();
    if (req.trigger.empty()) {
        throw std::invalid_argument("'trigger' must not be empty");
    }
    if (doc.contains("labels")) {
        req.labels = doc.at("labels").get<std::map<std::string, std::string>>();
    }
    if (doc.contains("vars")) {
        req.vars = doc.at("vars").get<std::map<std::string, std::string>>();
    }
    return req;
}

std::string render_text(const std::string& text, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find("{{", pos);
        if (open == std::string::npos) break;
        auto close = text.find("}}", open + 2);
        if (close == std::string::npos) break;

        out.append(text, pos, open - pos);
        auto name = text.substr(open + 2, close - open - 2);
        name.erase(0, name.find_first_not_of(' '));
        name.erase(name.find_last_not_of(' ') + 1);

        auto it = vars.find(name);
        if (it != vars.end()) {
            out += it->second;
        } else {
            out.append(text, open, close + 2 - open);
        }
        pos = close + 2;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

dispatch_worker::dispatch_worker(std::shared_ptr<const config_snapshot> snapshot,
                                 const worker_options& options,
                                 request_queue& queue,
                                 std::shared_ptr<spdlog::logger> log)
    : m_snapshot(std::move(snapshot)), m_options(options), m_queue(queue), m_log(std::move(log))
{
    if (m_options.metrics) {
        m_options.metrics->describe("notifications_deliveries_total",
            "Number of delivered notifications",
            metrics_registry::metric_type::counter);
        m_options.metrics->describe("notifications_delivery_failures_total",
            "Number of notifications that could not be delivered",
            metrics_registry::metric_type::counter);
    }
}

void dispatch_worker::init(std::stop_token scope) {
    if (scope.stop_requested()) {
        throw worker_error("cancelled before initialization");
    }

    m_log->info("Worker initialized for namespace '{}': {} templates, {} triggers, {} subscriptions",
               m_options.namespace_name, m_snapshot->templates.size(),
               m_snapshot->triggers.size(), m_snapshot->subscriptions.size());
}

void dispatch_worker::run(std::stop_token scope, unsigned int concurrency) {
    unsigned int count = concurrency > 0 ? concurrency : std::thread::hardware_concurrency();
    if (count == 0) count = 1;

    std::vector<std::thread> threads;
    threads.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        threads.emplace_back(&dispatch_worker::processor_loop, this, scope, i);
    }
    m_log->debug("Worker running with {} processors", count);

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    m_log->debug("Worker stopped");
}

std::vector<destination> dispatch_worker::recipients(
    const std::string& trigger, const std::map<std::string, std::string>& labels) const
{
    const auto& defaults = m_snapshot->default_triggers;
    bool is_default = std::find(defaults.begin(), defaults.end(), trigger) != defaults.end();

    std::vector<destination> result;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& sub : m_snapshot->subscriptions) {
        bool subscribed = sub.triggers.empty()
            ? is_default
            : std::find(sub.triggers.begin(), sub.triggers.end(), trigger) != sub.triggers.end();
        if (!subscribed || !sub.selector.matches(labels)) continue;

        for (const auto& dest : sub.recipients) {
            if (seen.emplace(dest.service, dest.recipient).second) {
                result.push_back(dest);
            }
        }
    }
    return result;
}

std::size_t dispatch_worker::dispatch(const notification_request& req) {
    m_processed.fetch_add(1, std::memory_order_relaxed);

    if (!m_options.selector.matches(req.labels)) {
        m_skipped.fetch_add(1, std::memory_order_relaxed);
        return 0;
    }

    auto trig_it = m_snapshot->triggers.find(req.trigger);
    if (trig_it == m_snapshot->triggers.end()) {
        m_log->warn("Notification request for unknown trigger '{}'", req.trigger);
        m_failures.fetch_add(1, std::memory_order_relaxed);
        return 0;
    }

    // Context values are available to templates, request vars take precedence
    auto vars = req.vars;
    vars.insert(m_snapshot->context.begin(), m_snapshot->context.end());

    std::vector<std::string> templates;
    for (const auto& cond : trig_it->second.conditions) {
        for (const auto& name : cond.send) {
            if (std::find(templates.begin(), templates.end(), name) == templates.end()) {
                templates.push_back(name);
            }
        }
    }

    std::size_t delivered = 0;
    for (const auto& dest : recipients(req.trigger, req.labels)) {
        auto svc = m_snapshot->registry.service(dest.service);
        for (const auto& name : templates) {
            const auto& tmpl = m_snapshot->templates.at(name);

            notification n;
            n.title = render_text(tmpl.title, vars);
            n.message = render_text(tmpl.message, vars);
            for (const auto& [field, value] : tmpl.fields) {
                n.fields[field] = render_text(value, vars);
            }

            bool ok = false;
            if (!svc) {
                m_log->warn("Failed to notify '{}' via '{}': service has no sink",
                            dest.recipient, dest.service);
            } else {
                try {
                    svc->send(n, dest);
                    ok = true;
                } catch (const std::exception& e) {
                    m_log->error("Failed to notify '{}' via '{}' using template '{}': {}",
                                 dest.recipient, dest.service, name, e.what());
                }
            }

            if (ok) {
                ++delivered;
                m_delivered.fetch_add(1, std::memory_order_relaxed);
                if (m_options.metrics) {
                    m_options.metrics->increment("notifications_deliveries_total",
                        {{"service", dest.service}, {"trigger", req.trigger}});
                }
            } else {
                m_failures.fetch_add(1, std::memory_order_relaxed);
                if (m_options.metrics) {
                    m_options.metrics->increment("notifications_delivery_failures_total",
                        {{"service", dest.service}});
                }
            }
        }
    }
    return delivered;
}

dispatch_worker::stats dispatch_worker::get_stats() const {
    return {
        m_processed.load(std::memory_order_relaxed),
        m_skipped.load(std::memory_order_relaxed),
        m_delivered.load(std::memory_order_relaxed),
        m_failures.load(std::memory_order_relaxed)
    };
}

void dispatch_worker::processor_loop(std::stop_token scope, unsigned int processor_id) {
    m_log->debug("Processor {} started", processor_id);

    notification_request req;
    while (!scope.stop_requested()) {
        // Block with timeout to allow checking the stop token
        if (!m_queue.wait_dequeue_timed(req, std::chrono::milliseconds(100))) continue;
        dispatch(req);
    }

    m_log->debug("Processor {} stopped", processor_id);
}

} // namespace notifctl

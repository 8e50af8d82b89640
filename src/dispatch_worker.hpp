#pragma once

#include "worker.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace notifctl {

// A trigger that fired for one application.
// Wire format: {"trigger": "...", "labels": {...}, "vars": {...}}
struct notification_request {
    std::string trigger;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> vars;
};

// Parse a JSON request. Throws on malformed input.
notification_request parse_notification_request(std::string_view json);

// Replace "{{name}}" placeholders with values from `vars`.
// Unknown placeholders are left untouched.
std::string render_text(const std::string& text, const std::map<std::string, std::string>& vars);

// Outlives every worker generation, so requests queued during a hand-off
// are processed by the replacement.
using request_queue = moodycamel::BlockingConcurrentQueue<notification_request>;

// Worker that sends notifications for fired triggers through the services
// of its configuration snapshot.
class dispatch_worker : public iworker {
public:
    struct stats {
        uint64_t processed = 0;
        uint64_t skipped = 0;
        uint64_t delivered = 0;
        uint64_t failures = 0;
    };

    dispatch_worker(std::shared_ptr<const config_snapshot> snapshot,
                    const worker_options& options,
                    request_queue& queue,
                    std::shared_ptr<spdlog::logger> log);

    void init(std::stop_token scope) override;

    // Spawn processor threads and block until `scope` is stop-requested.
    void run(std::stop_token scope, unsigned int concurrency) override;

    // Handle one request on the calling thread. Returns the number of
    // notifications delivered.
    std::size_t dispatch(const notification_request& req);

    // Destinations subscribed to `trigger` for an application with `labels`.
    std::vector<destination> recipients(const std::string& trigger,
                                        const std::map<std::string, std::string>& labels) const;

    stats get_stats() const;

private:
    void processor_loop(std::stop_token scope, unsigned int processor_id);

    std::shared_ptr<const config_snapshot> m_snapshot;
    worker_options m_options;
    request_queue& m_queue;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<uint64_t> m_processed{0};
    std::atomic<uint64_t> m_skipped{0};
    std::atomic<uint64_t> m_delivered{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace notifctl

#pragma once

#include "fatal.hpp"
#include "lifecycle_manager.hpp"
#include "resource_watcher.hpp"
#include "settings.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace notifctl {

// Combines the latest settings and secrets into configuration snapshots.
//
// Every update runs under one mutex, including validation and the hand-off
// to the lifecycle manager, so merge attempts form a strict total order and
// a worker is never started for a superseded snapshot.
class config_merger {
public:
    config_merger(snapshot_validator validator,
                  lifecycle_manager& lifecycle,
                  fatal_handler on_fatal,
                  std::shared_ptr<spdlog::logger> log);
    ~config_merger();

    config_merger(const config_merger&) = delete;
    config_merger& operator=(const config_merger&) = delete;

    // Record `payload` for `kind` and attempt a merge once both are known.
    void on_update(resource_kind kind, raw_payload payload);

    // Spawn one consumer thread per watcher. Must be called once.
    void start(std::vector<resource_watcher*> watchers);

    // Close the watchers and join the consumer threads.
    void stop();

    // Number of merge attempts (both resources present).
    uint64_t merge_attempts() const { return m_attempts.load(std::memory_order_relaxed); }

private:
    void consume(resource_watcher& watcher);

    snapshot_validator m_validator;
    lifecycle_manager& m_lifecycle;
    fatal_handler m_on_fatal;
    std::shared_ptr<spdlog::logger> m_log;

    // Protects the merged state and the snapshot generation counter.
    std::mutex m_mutex;
    std::optional<raw_payload> m_settings;
    std::optional<raw_payload> m_secrets;
    uint64_t m_generation = 0;

    std::atomic<uint64_t> m_attempts{0};

    std::atomic<bool> m_running{false};
    std::vector<resource_watcher*> m_watchers;
    std::vector<std::thread> m_threads;
};

} // namespace notifctl

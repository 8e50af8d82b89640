#pragma once

#include "worker.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace notifctl {

// Owns at most one running worker.
//
// apply() tears the previous worker down (cancel + join) before the
// replacement is constructed, so two workers never overlap. Callers
// serialize apply(); the merger does so under its own lock.
class lifecycle_manager {
public:
    lifecycle_manager(worker_factory factory,
                      worker_options options,
                      std::shared_ptr<spdlog::logger> log);
    ~lifecycle_manager();

    lifecycle_manager(const lifecycle_manager&) = delete;
    lifecycle_manager& operator=(const lifecycle_manager&) = delete;

    // Replace the running worker with one built from `snapshot`.
    // Snapshots not newer than the running one are ignored.
    // Throws worker_error if construction or initialization fails.
    void apply(std::shared_ptr<const config_snapshot> snapshot);

    // Cancel the running worker, if any. Called at process shutdown.
    void shutdown();

    // Lock-free; safe to poll while apply() is joining a worker.
    bool running() const { return m_running.load(std::memory_order_acquire); }

    // Generation of the running worker's snapshot, 0 if idle.
    uint64_t generation() const { return m_generation.load(std::memory_order_acquire); }

    uint64_t restarts() const { return m_restarts.load(std::memory_order_relaxed); }

private:
    struct worker_handle {
        iworker_uptr worker;
        std::stop_source scope;
        std::thread runner;
        uint64_t generation = 0;
    };

    // Requires m_mutex. Returns once the worker's run() has returned.
    void cancel_current();

    worker_factory m_factory;
    worker_options m_options;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    std::unique_ptr<worker_handle> m_current;

    // Mirror m_current for readers that must not take m_mutex
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_generation{0};
    std::atomic<uint64_t> m_restarts{0};
};

} // namespace notifctl

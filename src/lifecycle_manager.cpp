#include "lifecycle_manager.hpp"

namespace notifctl {

lifecycle_manager::lifecycle_manager(worker_factory factory,
                                     worker_options options,
                                     std::shared_ptr<spdlog::logger> log)
    : m_factory(std::move(factory)), m_options(std::move(options)), m_log(std::move(log))
{
    if (m_options.metrics) {
        m_options.metrics->describe("notifications_controller_restarts_total",
            "Number of times the worker was replaced after a settings update",
            metrics_registry::metric_type::counter);
        m_options.metrics->describe("notifications_controller_config_generation",
            "Generation of the configuration the running worker was built from",
            metrics_registry::metric_type::gauge);
    }
}

lifecycle_manager::~lifecycle_manager() {
    shutdown();
}

void lifecycle_manager::apply(std::shared_ptr<const config_snapshot> snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_current) {
        if (snapshot->generation <= m_current->generation) {
            m_log->warn("Ignoring configuration generation {}: worker already runs generation {}",
                        snapshot->generation, m_current->generation);
            return;
        }
        m_log->info("Settings had been updated. Restarting controller...");
        cancel_current();
        m_restarts.fetch_add(1, std::memory_order_relaxed);
        if (m_options.metrics) {
            m_options.metrics->increment("notifications_controller_restarts_total");
        }
    }

    auto handle = std::make_unique<worker_handle>();
    handle->generation = snapshot->generation;

    try {
        handle->worker = m_factory(snapshot, m_options);
    } catch (const std::exception& e) {
        throw worker_error(std::string("failed to create worker: ") + e.what());
    }
    if (!handle->worker) {
        throw worker_error("failed to create worker: factory returned no worker");
    }

    // Initialization runs to completion before the worker starts processing
    try {
        handle->worker->init(handle->scope.get_token());
    } catch (const std::exception& e) {
        handle->scope.request_stop();
        throw worker_error(std::string("failed to initialize worker: ") + e.what());
    }

    handle->runner = std::thread(
        [worker = handle->worker.get(),
         token = handle->scope.get_token(),
         concurrency = m_options.concurrency,
         generation = handle->generation,
         log = m_log]() {
            try {
                worker->run(token, concurrency);
            } catch (const std::exception& e) {
                log->error("Worker for configuration generation {} failed: {}", generation, e.what());
            }
        });

    m_log->info("Worker started (configuration generation {}, {} processors)",
               handle->generation, m_options.concurrency);
    if (m_options.metrics) {
        m_options.metrics->set_gauge("notifications_controller_config_generation",
                                     static_cast<double>(handle->generation));
    }
    m_generation.store(handle->generation, std::memory_order_release);
    m_running.store(true, std::memory_order_release);
    m_current = std::move(handle);
}

void lifecycle_manager::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current) {
        m_log->info("Stopping worker (configuration generation {})", m_current->generation);
        cancel_current();
    }
}

void lifecycle_manager::cancel_current() {
    m_current->scope.request_stop();
    if (m_current->runner.joinable()) {
        m_current->runner.join();
    }
    m_log->debug("Worker for configuration generation {} stopped", m_current->generation);
    m_current.reset();
    m_running.store(false, std::memory_order_release);
    m_generation.store(0, std::memory_order_release);
}

} // namespace notifctl

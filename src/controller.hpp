#pragma once

#include "config.hpp"
#include "config_merger.hpp"
#include "dispatch_worker.hpp"
#include "fatal.hpp"
#include "kv_resource_source.hpp"
#include "lifecycle_manager.hpp"
#include "metrics.hpp"
#include "metrics_server.hpp"
#include "resource_watcher.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace notifctl {

class controller {
public:
    // Throws std::invalid_argument if the app label selector is malformed.
    controller(asio::io_context& ioc, const config& cfg,
               std::shared_ptr<spdlog::logger> log,
               fatal_handler on_fatal);
    ~controller();

    // Bind the metrics endpoint. Throws std::runtime_error on bind failure.
    void serve_metrics();

    // Called once the NATS connection is established.
    // Starts the resource watches, the merger and the request subscription.
    asio::awaitable<void> start(nats_asio::iconnection_sptr conn);

    // Block the calling thread until both resources finished their initial
    // listing. Reports fatally on timeout. Must not run on the I/O thread.
    void await_initial_sync();

    // Stop merging and cancel the running worker. Called during shutdown.
    void stop();

private:
    // Callback: notification request for the running worker
    asio::awaitable<void> on_request_message(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;
    fatal_handler m_on_fatal;

    metrics_registry_sptr m_metrics;
    metrics_server m_metrics_server;

    // Survives worker hand-offs
    request_queue m_requests;

    resource_watcher m_settings_watcher;
    resource_watcher m_secrets_watcher;

    nats_asio::iconnection_sptr m_conn;
    std::unique_ptr<kv_resource_source> m_settings_source;
    std::unique_ptr<kv_resource_source> m_secrets_source;

    std::unique_ptr<lifecycle_manager> m_lifecycle;
    std::unique_ptr<config_merger> m_merger;

    std::atomic<uint64_t> m_requests_received{0};
    std::atomic<uint64_t> m_requests_rejected{0};
};

} // namespace notifctl

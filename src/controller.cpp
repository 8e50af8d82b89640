#include "controller.hpp"
#include "readiness_gate.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <iostream>

namespace notifctl {

namespace {

const std::string metrics_host = "0.0.0.0";

} // anonymous namespace

controller::controller(asio::io_context& ioc, const config& cfg,
                       std::shared_ptr<spdlog::logger> log,
                       fatal_handler on_fatal)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)), m_on_fatal(std::move(on_fatal)),
      m_metrics(std::make_shared<metrics_registry>()),
      m_metrics_server(metrics_host, cfg.metrics_port, m_metrics, m_log),
      m_settings_watcher({resource_kind::settings, cfg.settings_name}, m_log),
      m_secrets_watcher({resource_kind::secrets, cfg.secrets_name}, m_log)
{
    worker_options options;
    options.namespace_name = m_cfg.namespace_name;
    options.selector = label_selector::parse(m_cfg.app_label_selector);
    options.metrics = m_metrics;
    options.concurrency = m_cfg.processors_count;

    m_lifecycle = std::make_unique<lifecycle_manager>(
        [this](std::shared_ptr<const config_snapshot> snapshot, const worker_options& opts) -> iworker_uptr {
            return std::make_unique<dispatch_worker>(std::move(snapshot), opts, m_requests, m_log);
        },
        std::move(options), m_log);

    m_merger = std::make_unique<config_merger>(
        snapshot_validator(std::make_shared<console_service>(std::cout)),
        *m_lifecycle, m_on_fatal, m_log);

    m_metrics->describe("notifications_requests_total",
        "Number of notification requests received",
        metrics_registry::metric_type::counter);
    m_metrics->describe("notifications_requests_rejected_total",
        "Number of malformed notification requests",
        metrics_registry::metric_type::counter);
}

controller::~controller() {
    stop();
}

void controller::serve_metrics() {
    m_metrics_server.start();
}

asio::awaitable<void> controller::start(nats_asio::iconnection_sptr conn) {
    m_conn = std::move(conn);

    // Consumers first so no delivered event waits for a reader
    m_merger->start({&m_settings_watcher, &m_secrets_watcher});

    m_settings_source = std::make_unique<kv_resource_source>(
        m_conn, m_settings_watcher, m_cfg.namespace_name,
        std::chrono::milliseconds(m_cfg.sync_grace_ms),
        std::chrono::seconds(m_cfg.watch_retry_seconds), m_log);
    m_secrets_source = std::make_unique<kv_resource_source>(
        m_conn, m_secrets_watcher, m_cfg.namespace_name,
        std::chrono::milliseconds(m_cfg.sync_grace_ms),
        std::chrono::seconds(m_cfg.watch_retry_seconds), m_log);

    asio::co_spawn(m_ioc, m_secrets_source->run(), asio::detached);
    asio::co_spawn(m_ioc, m_settings_source->run(), asio::detached);

    // Subscribe to the notification request subject
    auto [req_sub, req_status] = co_await m_conn->subscribe(
        m_cfg.request_subject,
        [this](auto subject, auto reply_to, auto payload) {
            return on_request_message(subject, reply_to, payload);
        }
    );

    if (req_status.failed()) {
        m_on_fatal("Failed to subscribe to request subject '" + m_cfg.request_subject +
                   "': " + std::string(req_status.error()));
        co_return;
    }
    m_log->info("Listening for notification requests on '{}'", m_cfg.request_subject);

    // Start stats reporting
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Controller started (namespace={}, settings={}, secrets={})",
               m_cfg.namespace_name, m_cfg.settings_name, m_cfg.secrets_name);
}

void controller::await_initial_sync() {
    try {
        notifctl::await_initial_sync({&m_settings_watcher, &m_secrets_watcher},
                                     std::chrono::seconds(m_cfg.sync_timeout_seconds), *m_log);
    } catch (const sync_timeout& e) {
        m_on_fatal(e.what());
    }
}

void controller::stop() {
    if (m_merger) {
        m_merger->stop();
    }
    if (m_lifecycle) {
        m_lifecycle->shutdown();
    }
    m_metrics_server.stop();
}

asio::awaitable<void> controller::on_request_message(
    std::string_view /*subject*/,
    std::optional<std::string_view> /*reply_to*/,
    std::span<const char> payload)
{
    m_requests_received++;
    m_metrics->increment("notifications_requests_total");

    try {
        m_requests.enqueue(parse_notification_request(
            std::string_view(payload.data(), payload.size())));
    } catch (const std::exception& e) {
        m_requests_rejected++;
        m_metrics->increment("notifications_requests_rejected_total");
        m_log->warn("Ignoring malformed notification request: {}", e.what());
    }
    co_return;
}

asio::awaitable<void> controller::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        m_log->info("stats: requests={} rejected={} queue_depth={} merges={} restarts={} generation={} worker={}",
                   m_requests_received.load(),
                   m_requests_rejected.load(),
                   m_requests.size_approx(),
                   m_merger->merge_attempts(),
                   m_lifecycle->restarts(),
                   m_lifecycle->generation(),
                   m_lifecycle->running() ? "running" : "waiting for configuration");
    }
}

} // namespace notifctl

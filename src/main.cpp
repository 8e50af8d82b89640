#include "config.hpp"
#include "controller.hpp"
#include "fatal.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/signal_set.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("notifications_controller",
        "Notification worker that follows live configuration from NATS KV");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("namespace", "Namespace which controller handles (overrides config)", cxxopts::value<std::string>())
        ("processors-count", "Processors count", cxxopts::value<unsigned int>())
        ("app-label-selector", "App label selector", cxxopts::value<std::string>())
        ("loglevel", "Set the logging level. One of: debug|info|warn|error", cxxopts::value<std::string>())
        ("metrics-port", "Metrics port", cxxopts::value<uint16_t>())
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("controller");

    // Load config
    notifctl::config cfg;
    if (result.count("config")) {
        try {
            cfg = notifctl::load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            console->error("Failed to load config: {}", e.what());
            return 1;
        }
    }

    // CLI overrides
    if (result.count("address"))            cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))               cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("namespace"))          cfg.namespace_name = result["namespace"].as<std::string>();
    if (result.count("processors-count"))   cfg.processors_count = result["processors-count"].as<unsigned int>();
    if (result.count("app-label-selector")) cfg.app_label_selector = result["app-label-selector"].as<std::string>();
    if (result.count("loglevel"))           cfg.log_level = result["loglevel"].as<std::string>();
    if (result.count("metrics-port"))       cfg.metrics_port = result["metrics-port"].as<uint16_t>();

    // Set log level
    auto level = notifctl::parse_log_level(cfg.log_level);
    if (!level) {
        console->error("Invalid log level '{}'", cfg.log_level);
        return 1;
    }
    spdlog::set_level(*level);

    console->info("notifications_controller starting");
    console->info("  server:    {}:{}", cfg.nats_address, cfg.nats_port);
    console->info("  namespace: {}", cfg.namespace_name);
    console->info("  resources: {}, {}", cfg.settings_name, cfg.secrets_name);
    console->info("  requests:  {}", cfg.request_subject);
    console->info("  processors: {}", cfg.processors_count);
    if (!cfg.app_label_selector.empty()) {
        console->info("  app label selector: {}", cfg.app_label_selector);
    }

    // Single-threaded io_context for NATS I/O, run on its own
    // thread so the main thread can block on the initial sync.
    asio::io_context ioc(1);
    auto work = asio::make_work_guard(ioc);

    // Graceful shutdown
    std::promise<void> shutdown_requested;
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        shutdown_requested.set_value();
    });

    std::unique_ptr<notifctl::controller> engine;
    try {
        engine = std::make_unique<notifctl::controller>(
            ioc, cfg, console, notifctl::exit_on_fatal(console));
        engine->serve_metrics();
    } catch (const std::exception& e) {
        console->critical("Failed to start: {}", e.what());
        return 1;
    }

    // Build NATS connect config
    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;

    // SSL config
    std::optional<nats_asio::ssl_config> ssl_conf;
    if (!cfg.tls_cert.empty()) {
        nats_asio::ssl_config sc;
        sc.cert = cfg.tls_cert;
        sc.key  = cfg.tls_key;
        sc.ca   = cfg.tls_ca;
        sc.verify = true;
        ssl_conf = sc;
    }

    // Callbacks
    auto on_connected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->info("Connected to NATS");
        co_return;
    };

    auto on_disconnected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->warn("Disconnected from NATS");
        co_return;
    };

    auto on_error = [console](nats_asio::iconnection& /*c*/, std::string_view err) -> asio::awaitable<void> {
        console->error("NATS connection error: {}", err);
        co_return;
    };

    auto conn = nats_asio::create_connection(
        ioc, on_connected, on_disconnected, on_error, ssl_conf);

    conn->start(nats_cfg);

    std::thread io_thread([&ioc]() { ioc.run(); });

    // Start watching once connected
    std::promise<void> started;
    auto started_future = started.get_future();
    asio::co_spawn(ioc,
        [engine = engine.get(), c = conn, &started]() mutable -> asio::awaitable<void> {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            while (!c->is_connected()) {
                timer.expires_after(std::chrono::milliseconds(100));
                co_await timer.async_wait(asio::use_awaitable);
            }
            co_await engine->start(c);
            started.set_value();
        },
        asio::detached
    );

    auto shutdown_future = shutdown_requested.get_future();

    // Wait for the watches, unless shutdown comes first
    while (started_future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (shutdown_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) break;
    }

    if (started_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        engine->await_initial_sync();
        shutdown_future.wait();
    }

    // Shutdown ordering:
    // 1. Stop merging and cancel the running worker (joins its threads)
    engine->stop();

    // 2. Stop the I/O thread
    work.reset();
    ioc.stop();
    io_thread.join();

    console->info("notifications_controller stopped");
    return 0;
}

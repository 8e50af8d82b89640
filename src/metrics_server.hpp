#pragma once

#include "metrics.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace notifctl {

inline constexpr const char* metrics_content_type = "text/plain; version=0.0.4";

// Handler for GET /metrics.
void handle_metrics_request(const metrics_registry& registry,
                            const httplib::Request& req,
                            httplib::Response& res);

// HTTP endpoint exposing the metrics registry. Serves on its own thread so
// the NATS I/O thread never handles scrapes.
class metrics_server {
public:
    metrics_server(std::string host, uint16_t port,
                   metrics_registry_sptr registry,
                   std::shared_ptr<spdlog::logger> log);
    ~metrics_server();

    metrics_server(const metrics_server&) = delete;
    metrics_server& operator=(const metrics_server&) = delete;

    // Bind and start serving. Port 0 binds an ephemeral port.
    // Returns the bound port. Throws std::runtime_error if binding fails.
    uint16_t start();

    // Stop serving and join the server thread. Safe to call repeatedly.
    void stop();

    bool running() const { return m_running.load(); }

private:
    std::string m_host;
    uint16_t m_port;
    metrics_registry_sptr m_registry;
    std::shared_ptr<spdlog::logger> m_log;

    std::mutex m_mutex;
    httplib::Server m_server;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_listener_done{false};
};

} // namespace notifctl

#include "metrics_server.hpp"
#include <chrono>
#include <stdexcept>

namespace notifctl {

void handle_metrics_request(const metrics_registry& registry,
                            const httplib::Request& /*req*/,
                            httplib::Response& res) {
    res.status = 200;
    res.set_content(registry.render(), metrics_content_type);
}

metrics_server::metrics_server(std::string host, uint16_t port,
                               metrics_registry_sptr registry,
                               std::shared_ptr<spdlog::logger> log)
    : m_host(std::move(host)), m_port(port), m_registry(std::move(registry)), m_log(std::move(log))
{
    m_server.Get("/metrics", [registry = m_registry](const httplib::Request& req, httplib::Response& res) {
        handle_metrics_request(*registry, req, res);
    });
}

metrics_server::~metrics_server() {
    stop();
}

uint16_t metrics_server::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running.load()) return m_port;

    if (m_port == 0) {
        int bound = m_server.bind_to_any_port(m_host);
        if (bound <= 0) {
            throw std::runtime_error("failed to bind metrics endpoint on " + m_host);
        }
        m_port = static_cast<uint16_t>(bound);
    } else if (!m_server.bind_to_port(m_host, m_port)) {
        throw std::runtime_error("failed to bind metrics endpoint on " + m_host + ":" +
                                 std::to_string(m_port));
    }

    m_running.store(true);
    m_listener_done.store(false);
    m_thread = std::thread([this]() {
        if (!m_server.listen_after_bind()) {
            m_log->error("metrics_server: listener on port {} exited with an error", m_port);
        }
        m_listener_done.store(true);
    });

    // stop() is a no-op until the listener loop runs
    while (!m_server.is_running() && !m_listener_done.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    m_log->info("serving metrics on {}:{}", m_host, m_port);
    return m_port;
}

void metrics_server::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running.exchange(false)) return;

    m_server.stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_log->debug("metrics_server: stopped");
}

} // namespace notifctl

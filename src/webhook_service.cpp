#include "webhook_service.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace notifctl {

namespace {

constexpr time_t connect_timeout_seconds = 5;
constexpr time_t read_timeout_seconds = 10;

std::string option_or_empty(const service_config& cfg, const std::string& name) {
    auto it = cfg.options.find(name);
    return it == cfg.options.end() ? std::string() : it->second;
}

} // anonymous namespace

webhook_service::webhook_service(const service_config& cfg)
    : m_name(cfg.name),
      m_username(option_or_empty(cfg, "username")),
      m_password(option_or_empty(cfg, "password"))
{
    auto url = option_or_empty(cfg, "url");
    if (url.empty()) {
        throw std::invalid_argument("option 'url' is required");
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("'" + url + "' is not an absolute URL");
    }
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme '" + scheme + "'");
    }

    auto path_start = url.find('/', scheme_end + 3);
    m_endpoint = url.substr(0, path_start);
    m_path = path_start == std::string::npos ? "/" : url.substr(path_start);
    if (m_endpoint.size() == scheme_end + 3) {
        throw std::invalid_argument("'" + url + "' has no host");
    }
}

void webhook_service::send(const notification& n, const destination& dest) {
    nlohmann::json body = {
        {"recipient", dest.recipient},
        {"title", n.title},
        {"message", n.message},
        {"fields", n.fields},
    };

    httplib::Client client(m_endpoint);
    if (!client.is_valid()) {
        throw std::runtime_error("webhook '" + m_name + "': cannot connect to " + m_endpoint);
    }
    client.set_connection_timeout(connect_timeout_seconds, 0);
    client.set_read_timeout(read_timeout_seconds, 0);
    if (!m_username.empty()) {
        client.set_basic_auth(m_username, m_password);
    }

    auto res = client.Post(m_path, body.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("webhook '" + m_name + "': request to " + m_endpoint + m_path +
                                 " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("webhook '" + m_name + "': " + m_endpoint + m_path +
                                 " replied with status " + std::to_string(res->status));
    }
}

bool has_service_implementation(const std::string& type) {
    return type == "webhook";
}

notification_service_sptr make_service(const service_config& cfg) {
    if (cfg.type == "webhook") {
        try {
            return std::make_shared<webhook_service>(cfg);
        } catch (const std::invalid_argument& e) {
            throw validation_error("service '" + cfg.name + "': " + e.what());
        }
    }
    throw validation_error("service '" + cfg.name + "': type '" + cfg.type + "' is not supported");
}

} // namespace notifctl

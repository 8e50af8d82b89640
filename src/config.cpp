#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace notifctl {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "debug")                  return spdlog::level::debug;
    if (s == "info")                   return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error")                  return spdlog::level::err;
    return std::nullopt;
}

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg;

    if (!root.IsMap()) {
        throw std::runtime_error("config: root must be a mapping");
    }

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Resources
    if (auto n = root["namespace"])     cfg.namespace_name = n.as<std::string>();
    if (auto n = root["settings_name"]) cfg.settings_name = n.as<std::string>();
    if (auto n = root["secrets_name"])  cfg.secrets_name = n.as<std::string>();

    if (cfg.namespace_name.empty()) {
        throw std::runtime_error("config: 'namespace' must not be empty");
    }
    if (cfg.settings_name.empty() || cfg.secrets_name.empty()) {
        throw std::runtime_error("config: resource names must not be empty");
    }
    if (cfg.settings_name == cfg.secrets_name) {
        throw std::runtime_error("config: 'settings_name' and 'secrets_name' must differ");
    }

    // Worker
    if (auto n = root["request_subject"])    cfg.request_subject = n.as<std::string>();
    if (auto n = root["app_label_selector"]) cfg.app_label_selector = n.as<std::string>();
    if (auto n = root["processors_count"])   cfg.processors_count = n.as<unsigned int>();

    // Startup
    if (auto n = root["sync_timeout_seconds"]) cfg.sync_timeout_seconds = n.as<uint32_t>();
    if (auto n = root["sync_grace_ms"])        cfg.sync_grace_ms = n.as<uint32_t>();
    if (auto n = root["watch_retry_seconds"])  cfg.watch_retry_seconds = n.as<uint32_t>();

    // Operational
    if (auto n = root["metrics_port"])           cfg.metrics_port = n.as<uint16_t>();
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }

    return cfg;
}

} // namespace notifctl

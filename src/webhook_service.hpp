#pragma once

#include "notifier.hpp"
#include "settings.hpp"
#include <string>

namespace notifctl {

// Posts notifications as JSON to an HTTP endpoint.
//
// Options:
//   url       http:// or https:// endpoint (required)
//   username  basic auth user (optional)
//   password  basic auth password (optional)
class webhook_service : public notification_service {
public:
    // Throws std::invalid_argument if the options are unusable.
    explicit webhook_service(const service_config& cfg);

    // Throws std::runtime_error on transport errors and non-2xx replies.
    void send(const notification& n, const destination& dest) override;

    const std::string& endpoint() const { return m_endpoint; }
    const std::string& path() const { return m_path; }

private:
    std::string m_name;
    std::string m_endpoint;   // scheme://host[:port]
    std::string m_path;
    std::string m_username;
    std::string m_password;
};

// Whether "service.<type>" entries of this type can be delivered to.
bool has_service_implementation(const std::string& type);

// Build the sink for a configured service. Throws validation_error.
notification_service_sptr make_service(const service_config& cfg);

} // namespace notifctl

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace notifctl {

// Name of the built-in service registered on every valid snapshot.
inline constexpr const char* console_service_name = "console";

struct notification {
    std::string title;
    std::string message;
    // Service-specific template fields (e.g. "slack"), kept verbatim
    std::map<std::string, std::string> fields;
};

struct destination {
    std::string service;
    std::string recipient;
};

// A sink able to deliver notifications. Throws on delivery failure.
class notification_service {
public:
    virtual ~notification_service() = default;
    virtual void send(const notification& n, const destination& dest) = 0;
};

using notification_service_sptr = std::shared_ptr<notification_service>;

// Writes notifications to a stream. Used for debugging.
class console_service : public notification_service {
public:
    explicit console_service(std::ostream& out);
    void send(const notification& n, const destination& dest) override;

private:
    std::mutex m_mutex;
    std::ostream& m_out;
};

// Registry of named services carried by a configuration snapshot.
class notifier {
public:
    // Register (or replace) a service under `name`.
    void add_service(const std::string& name, notification_service_sptr service);

    // nullptr if no service is registered under `name`.
    notification_service_sptr service(const std::string& name) const;

    bool has_service(const std::string& name) const;
    std::vector<std::string> service_names() const;

private:
    std::map<std::string, notification_service_sptr> m_services;
};

} // namespace notifctl

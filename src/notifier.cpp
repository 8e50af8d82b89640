#include "notifier.hpp"

namespace notifctl {

console_service::console_service(std::ostream& out)
    : m_out(out)
{}

void console_service::send(const notification& n, const destination& dest) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << "To: " << dest.recipient << "\n";
    if (!n.title.empty()) {
        m_out << "Title: " << n.title << "\n";
    }
    m_out << "Body: " << n.message << "\n";
    for (const auto& [name, value] : n.fields) {
        m_out << name << ": " << value << "\n";
    }
    m_out.flush();
}

void notifier::add_service(const std::string& name, notification_service_sptr service) {
    m_services[name] = std::move(service);
}

notification_service_sptr notifier::service(const std::string& name) const {
    auto it = m_services.find(name);
    if (it != m_services.end()) return it->second;
    return nullptr;
}

bool notifier::has_service(const std::string& name) const {
    return m_services.count(name) > 0;
}

std::vector<std::string> notifier::service_names() const {
    std::vector<std::string> names;
    names.reserve(m_services.size());
    for (const auto& [name, svc] : m_services) {
        names.push_back(name);
    }
    return names;
}

} // namespace notifctl

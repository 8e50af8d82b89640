#pragma once

#include <map>
#include <string>
#include <vector>

namespace notifctl {

// Equality-based label selector: "app=web,tier!=cache,team".
// An empty selector matches everything.
class label_selector {
public:
    enum class op { equals, not_equals, exists };

    struct requirement {
        std::string key;
        op operation;
        std::string value;
    };

    label_selector() = default;

    // Throws std::invalid_argument on malformed input.
    static label_selector parse(const std::string& text);

    bool matches(const std::map<std::string, std::string>& labels) const;
    bool empty() const { return m_requirements.empty(); }

    const std::vector<requirement>& requirements() const { return m_requirements; }

private:
    std::vector<requirement> m_requirements;
};

} // namespace notifctl

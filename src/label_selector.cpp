#include "label_selector.hpp"
#include <stdexcept>

namespace notifctl {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

label_selector label_selector::parse(const std::string& text) {
    label_selector sel;
    if (trim(text).empty()) return sel;

    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string term = trim(text.substr(start, comma - start));
        start = comma + 1;

        if (term.empty()) {
            throw std::invalid_argument("label selector '" + text + "' has an empty term");
        }

        requirement req;
        auto pos = term.find("!=");
        if (pos != std::string::npos) {
            req.operation = op::not_equals;
            req.key = trim(term.substr(0, pos));
            req.value = trim(term.substr(pos + 2));
        } else if ((pos = term.find("==")) != std::string::npos) {
            req.operation = op::equals;
            req.key = trim(term.substr(0, pos));
            req.value = trim(term.substr(pos + 2));
        } else if ((pos = term.find('=')) != std::string::npos) {
            req.operation = op::equals;
            req.key = trim(term.substr(0, pos));
            req.value = trim(term.substr(pos + 1));
        } else {
            req.operation = op::exists;
            req.key = term;
        }

        if (req.key.empty()) {
            throw std::invalid_argument("label selector term '" + term + "' has no key");
        }
        if (req.key.find_first_of("=! ") != std::string::npos ||
            req.value.find_first_of("=! ") != std::string::npos) {
            throw std::invalid_argument("label selector term '" + term + "' is malformed");
        }
        sel.m_requirements.push_back(std::move(req));
    }
    return sel;
}

bool label_selector::matches(const std::map<std::string, std::string>& labels) const {
    for (const auto& req : m_requirements) {
        auto it = labels.find(req.key);
        switch (req.operation) {
            case op::exists:
                if (it == labels.end()) return false;
                break;
            case op::equals:
                if (it == labels.end() || it->second != req.value) return false;
                break;
            case op::not_equals:
                if (it != labels.end() && it->second == req.value) return false;
                break;
        }
    }
    return true;
}

} // namespace notifctl

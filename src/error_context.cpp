#include "error_context.hpp"
#include <algorithm>
#include <sstream>

namespace redfish_catalog {

ErrorContext& ErrorContext::Set(const std::string& key, const std::string& value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const std::pair<std::string, std::string>& entry) { return entry.first == key; });
    if (it != entries_.end()) {
        it->second = value;
    } else {
        entries_.emplace_back(key, value);
    }
    return *this;
}

std::string ErrorContext::Get(const std::string& key) const {
    for (const auto& [entry_key, value] : entries_) {
        if (entry_key == key) {
            return value;
        }
    }
    return "";
}

bool ErrorContext::Has(const std::string& key) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&key](const std::pair<std::string, std::string>& entry) { return entry.first == key; });
}

std::string ErrorContext::Format(const std::string& base_message) const {
    if (entries_.empty()) {
        return base_message;
    }

    std::ostringstream result;
    result << base_message << " [";

    bool first = true;
    for (const auto& [key, value] : entries_) {
        if (!first) {
            result << ", ";
        }
        result << key << ": " << value;
        first = false;
    }

    result << "]";
    return result.str();
}

void ErrorContext::Clear() {
    entries_.clear();
}

bool ErrorContext::IsEmpty() const {
    return entries_.empty();
}

} // namespace redfish_catalog

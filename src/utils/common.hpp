#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace mathguard::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline bool IsDunder(const std::string& name) {
    return name.size() >= 4 &&
        name.compare(0, 2, "__") == 0 &&
        name.compare(name.size() - 2, 2, "__") == 0;
}

// Shortens long payloads (source code, worker stderr) before they reach a log line.
inline std::string Truncate(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...(" + std::to_string(text.size() - limit) + " more bytes)";
}

}  // namespace mathguard::utils

#pragma once

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace scriptbox::utils {

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

inline bool IsBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline std::string TrimRight(const std::string& value) {
    auto end = value.size();
    while (end > 0 && IsBlank(value[end - 1])) {
        --end;
    }
    return value.substr(0, end);
}

inline std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    while (begin < value.size() && IsBlank(value[begin])) {
        ++begin;
    }
    return TrimRight(value.substr(begin));
}

inline bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

// Splits on '\n'; a trailing newline does not produce an extra empty line.
inline std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

inline double UnixSeconds(std::chrono::system_clock::time_point point) {
    return std::chrono::duration<double>(point.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

}  // namespace scriptbox::utils

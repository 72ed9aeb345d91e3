#include "text_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>

namespace tessera::core {

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    if (!parse_non_negative_int(value, parsed) || parsed == 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed < 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_double(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }
    std::istringstream iss(value);
    double parsed = 0.0;
    char extra = '\0';
    if (!(iss >> parsed)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    if (!std::isfinite(parsed) || parsed < 0.0) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace tessera::core

#pragma once

#include <string>

namespace tessera::core {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_non_negative_double(const std::string& value, double& out);

} // namespace tessera::core

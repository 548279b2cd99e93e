#pragma once

#include <string>
#include <vector>

namespace occm {

std::string trim(const std::string& value);
std::string to_lower(std::string value);
bool contains_ci(const std::string& haystack, const std::string& needle);
std::vector<std::string> split(const std::string& value, char delimiter);

}

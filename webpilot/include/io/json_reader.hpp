#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace webpilot::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);
std::vector<nlohmann::json> parseJsonLines(const std::string &text);
std::vector<std::string> splitFlags(const std::string &text);

} // namespace webpilot::io

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/project.hpp"
#include "nlohmann/json.hpp"

namespace webpilot::model {

constexpr const char *kPackageConfigFile = "web.json";

std::optional<TargetKind> targetKindFromMetadata(const std::vector<std::string> &kinds);

// Reads the output of `cargo metadata --format-version 1`.
std::optional<Project> loadProjectMetadata(const nlohmann::json &metadata, const webpilot::Context &ctx);
std::optional<Project> queryProjectMetadata(const webpilot::Context &ctx, const std::filesystem::path &manifestDir);

PackageConfig loadPackageConfig(const std::filesystem::path &manifestDir, const webpilot::Context &ctx);

} // namespace webpilot::model

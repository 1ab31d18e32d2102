#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "build/build_executor.hpp"
#include "build/emscripten.hpp"
#include "commands/command_line.hpp"
#include "core/context.hpp"
#include "model/project.hpp"

namespace webpilot::commands {

struct BuildServices {
    build::ToolchainProvisioner &provisioner;
    build::Toolchain &toolchain;
    build::ArtifactPostProcessor &postProcessor;
};

int runBuildCommand(
    const webpilot::Context &ctx,
    const std::filesystem::path &projectDir,
    const std::vector<std::string> &args
);

int executeBuild(
    const webpilot::Context &ctx,
    const model::Project &project,
    BuildServices services,
    const CommandLine &commandLine
);

} // namespace webpilot::commands

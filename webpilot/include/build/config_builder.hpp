#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "build/config.hpp"
#include "build/emscripten.hpp"
#include "core/context.hpp"
#include "model/project.hpp"

namespace webpilot::build {

// Exit status used when a declared link argument cannot be passed through.
constexpr int kUnquotableLinkArgExitCode = 101;

struct ToolchainAugmentation {
    std::vector<std::filesystem::path> paths;
    std::vector<std::string> flags;
    std::vector<std::pair<std::string, std::string>> environment;
};

Triplet resolveTriplet(const BuildFlags &flags);

BuildType requestedBuildType(const BuildFlags &flags);

// Debug builds for wasm32-unknown-unknown are known to be broken, so they
// are turned into release builds.
BuildType resolveBuildType(BuildType requested, Triplet triplet, const webpilot::Context &ctx);

ToolchainAugmentation augmentForToolchain(
    Triplet triplet,
    BuildType requested,
    Profile profile,
    bool useSystemEmscripten,
    ToolchainProvisioner &provisioner
);

// Appends `-C link-arg=<arg>` for every argument. Terminates the process
// with kUnquotableLinkArgExitCode if an argument contains whitespace.
void applyUserLinkArgs(
    std::vector<std::string> &flags,
    const std::vector<std::string> &linkArgs,
    const webpilot::Context &ctx
);

BuildConfiguration buildConfiguration(
    const webpilot::Context &ctx,
    const BuildFlags &flags,
    const model::Package &package,
    const model::PackageConfig &packageConfig,
    const model::Target &target,
    Profile profile,
    ToolchainProvisioner &provisioner
);

} // namespace webpilot::build

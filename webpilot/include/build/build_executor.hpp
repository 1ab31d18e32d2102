#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "build/config.hpp"
#include "core/context.hpp"
#include "core/error.hpp"

namespace webpilot::build {

struct BuildResult {
    std::vector<std::filesystem::path> artifacts;
    bool success = false;
};

class Toolchain {
public:
    virtual ~Toolchain() = default;

    // Returns the produced artifacts, or nothing if the build failed. The
    // toolchain is expected to have reported the failure itself.
    virtual std::optional<std::vector<std::filesystem::path>> build(const BuildConfiguration &config) = 0;
};

class ArtifactPostProcessor {
public:
    virtual ~ArtifactPostProcessor() = default;

    // May write files next to the artifact; returns the paths it created.
    virtual std::vector<std::filesystem::path> process(
        const BuildConfiguration &config,
        const std::filesystem::path &artifact
    ) = 0;
};

bool isNativeBinary(const std::filesystem::path &artifact);

class BuildExecutor {
public:
    BuildExecutor(const webpilot::Context &ctx, Toolchain &toolchain, ArtifactPostProcessor &postProcessor);

    core::Result<BuildResult> run(const BuildConfiguration &config) const;

private:
    const webpilot::Context &ctx_;
    Toolchain &toolchain_;
    ArtifactPostProcessor &postProcessor_;
};

} // namespace webpilot::build

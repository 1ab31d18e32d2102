#include "build/build_executor.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace fs = std::filesystem;

namespace webpilot::build {

bool isNativeBinary(const fs::path &artifact) {
    std::string ext = artifact.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".wasm";
}

BuildExecutor::BuildExecutor(const webpilot::Context &ctx, Toolchain &toolchain, ArtifactPostProcessor &postProcessor)
    : ctx_(ctx), toolchain_(toolchain), postProcessor_(postProcessor) {}

core::Result<BuildResult> BuildExecutor::run(const BuildConfiguration &config) const {
    ctx_.log("Building ", model::targetKindName(config.target.kind), " `", config.target.name, "` of ",
             config.package, " for ", tripletName(config.triplet),
             config.buildType == BuildType::Release ? " (release)" : " (debug)");

    auto artifacts = toolchain_.build(config);
    if (!artifacts.has_value()) {
        return core::Result<BuildResult>::error(core::Error::build());
    }

    BuildResult result;
    result.success = true;
    result.artifacts = artifacts.value();

    std::vector<fs::path> derived;
    for (const auto &artifact : artifacts.value()) {
        if (!isNativeBinary(artifact)) {
            continue;
        }
        for (auto &path : postProcessor_.process(config, artifact)) {
            ctx_.debug("Derived artifact: ", path.string());
            derived.push_back(std::move(path));
        }
    }
    result.artifacts.insert(result.artifacts.end(), derived.begin(), derived.end());
    return core::Result<BuildResult>::ok(std::move(result));
}

} // namespace webpilot::build

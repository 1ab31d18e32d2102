#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "build/build_executor.hpp"
#include "core/context.hpp"

namespace webpilot::build {

std::string renderWasmLoader(const std::string &wasmFileName);

// Writes a Node.js loader next to wasm32-unknown-unknown binaries so they can
// be started like any other script artifact.
class WasmLoaderGenerator : public ArtifactPostProcessor {
public:
    explicit WasmLoaderGenerator(const webpilot::Context &ctx);

    std::vector<std::filesystem::path> process(
        const BuildConfiguration &config,
        const std::filesystem::path &artifact
    ) override;

private:
    const webpilot::Context &ctx_;
};

} // namespace webpilot::build

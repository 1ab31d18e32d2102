#pragma once

#include <filesystem>
#include <optional>

#include "core/context.hpp"

namespace webpilot::build {

struct EmscriptenPaths {
    std::filesystem::path root;
    std::filesystem::path llvm;
    std::optional<std::filesystem::path> binaryen;
};

class ToolchainProvisioner {
public:
    virtual ~ToolchainProvisioner() = default;

    // Nothing returned means "use whatever Emscripten is on PATH".
    virtual std::optional<EmscriptenPaths> provision(bool preferSystem, bool targetingWasm) = 0;
};

// Picks up a prebuilt Emscripten tree laid out as
// <root>/emscripten, <root>/emscripten-fastcomp and <root>/binaryen.
class LocalEmscriptenProvisioner : public ToolchainProvisioner {
public:
    explicit LocalEmscriptenProvisioner(const webpilot::Context &ctx);

    std::optional<EmscriptenPaths> provision(bool preferSystem, bool targetingWasm) override;

    static std::filesystem::path defaultInstallRoot();

private:
    const webpilot::Context &ctx_;
};

} // namespace webpilot::build

#include "build/emscripten.hpp"

#include <system_error>

#include "io/env.hpp"

namespace fs = std::filesystem;

namespace webpilot::build {
namespace {

bool isDirectory(const fs::path &path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

} // namespace

LocalEmscriptenProvisioner::LocalEmscriptenProvisioner(const webpilot::Context &ctx) : ctx_(ctx) {}

fs::path LocalEmscriptenProvisioner::defaultInstallRoot() {
    if (const auto root = io::envValue("WEBPILOT_EMSCRIPTEN_ROOT"); root.has_value() && !root->empty()) {
        return fs::path(root.value());
    }

#ifdef _WIN32
    const auto home = io::envValue("LOCALAPPDATA");
    if (home.has_value() && !home->empty()) {
        return fs::path(home.value()) / "webpilot" / "emscripten";
    }
#else
    const auto home = io::envValue("HOME");
    if (home.has_value() && !home->empty()) {
        return fs::path(home.value()) / ".local" / "share" / "webpilot" / "emscripten";
    }
#endif
    return {};
}

std::optional<EmscriptenPaths> LocalEmscriptenProvisioner::provision(bool preferSystem, bool targetingWasm) {
    if (preferSystem) {
        return std::nullopt;
    }

    const fs::path root = defaultInstallRoot();
    if (root.empty() || !isDirectory(root / "emscripten") || !isDirectory(root / "emscripten-fastcomp")) {
        ctx_.warn("No prebuilt Emscripten found",
                  root.empty() ? std::string() : " in " + root.string(),
                  "; falling back to the one on PATH");
        return std::nullopt;
    }

    EmscriptenPaths paths;
    paths.root = root / "emscripten";
    paths.llvm = root / "emscripten-fastcomp";
    if (targetingWasm) {
        if (isDirectory(root / "binaryen")) {
            paths.binaryen = root / "binaryen";
        } else {
            ctx_.warn("Binaryen not found in ", root.string(), "; WebAssembly builds may fail");
        }
    }

    ctx_.debug("Using Emscripten from ", paths.root.string());
    return paths;
}

} // namespace webpilot::build

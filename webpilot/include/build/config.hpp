#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "model/project.hpp"

namespace webpilot::build {

enum class Triplet {
    AsmJsEmscripten,
    WasmEmscripten,
    WasmNative,
};

enum class BuildType {
    Debug,
    Release,
};

// Test links in the exit runtime; Main does not.
enum class Profile {
    Main,
    Test,
};

enum class MessageFormat {
    Human,
    Json,
};

// Build-related command flags, as given by the user.
struct BuildFlags {
    bool targetNativeWasm = false;
    bool targetEmscriptenWasm = false;
    bool release = false;
    std::vector<std::string> features;
    bool noDefaultFeatures = false;
    bool allFeatures = false;
    bool useSystemEmscripten = false;
    MessageFormat messageFormat = MessageFormat::Human;
    bool verbose = false;
};

struct BuildTarget {
    model::TargetKind kind = model::TargetKind::Lib;
    std::string name;
    Profile profile = Profile::Main;
};

struct BuildConfiguration {
    BuildTarget target;
    Triplet triplet = Triplet::AsmJsEmscripten;
    BuildType buildType = BuildType::Debug;
    std::string package;
    std::vector<std::string> features;
    bool noDefaultFeatures = false;
    bool allFeatures = false;
    std::vector<std::filesystem::path> extraPaths;
    std::vector<std::string> extraFlags;
    std::vector<std::pair<std::string, std::string>> extraEnvironment;
    MessageFormat messageFormat = MessageFormat::Human;
    bool verbose = false;
};

inline const char *tripletName(Triplet triplet) {
    switch (triplet) {
    case Triplet::AsmJsEmscripten:
        return "asmjs-unknown-emscripten";
    case Triplet::WasmEmscripten:
        return "wasm32-unknown-emscripten";
    case Triplet::WasmNative:
        return "wasm32-unknown-unknown";
    }
    return "asmjs-unknown-emscripten";
}

inline bool isEmscripten(Triplet triplet) {
    return triplet == Triplet::AsmJsEmscripten || triplet == Triplet::WasmEmscripten;
}

inline bool isWasm(Triplet triplet) {
    return triplet == Triplet::WasmEmscripten || triplet == Triplet::WasmNative;
}

} // namespace webpilot::build

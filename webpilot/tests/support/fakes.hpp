#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "build/build_executor.hpp"
#include "build/emscripten.hpp"
#include "test/browser_harness.hpp"
#include "test/script_runtime.hpp"

namespace webpilot::testing {

inline std::filesystem::path makeTempDir(const std::string &name)
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto dir = std::filesystem::temp_directory_path() / ("webpilot_test_" + name + "_" + std::to_string(now));
    std::filesystem::create_directories(dir);
    return std::filesystem::canonical(dir);
}

inline void cleanupTemp(const std::filesystem::path &root)
{
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

class FakeProvisioner : public build::ToolchainProvisioner {
public:
    std::optional<build::EmscriptenPaths> paths;
    int calls = 0;
    bool lastPreferSystem = false;
    bool lastTargetingWasm = false;

    std::optional<build::EmscriptenPaths> provision(bool preferSystem, bool targetingWasm) override
    {
        ++calls;
        lastPreferSystem = preferSystem;
        lastTargetingWasm = targetingWasm;
        return paths;
    }
};

// Produces `<outDir>/<target>.js` (and `.wasm` for wasm triplets) unless the
// target is listed in `failing`.
class FakeToolchain : public build::Toolchain {
public:
    std::filesystem::path outDir = "/tmp/webpilot-fake";
    std::filesystem::path wasmDir;
    std::set<std::string> failing;
    std::vector<build::BuildConfiguration> built;

    std::optional<std::vector<std::filesystem::path>> build(const build::BuildConfiguration &config) override
    {
        built.push_back(config);
        if (failing.count(config.target.name) != 0)
        {
            return std::nullopt;
        }

        std::vector<std::filesystem::path> out;
        if (config.triplet != build::Triplet::WasmNative)
        {
            out.push_back(outDir / (config.target.name + ".js"));
        }
        if (build::isWasm(config.triplet))
        {
            const auto dir = wasmDir.empty() ? outDir : wasmDir;
            out.push_back(dir / (config.target.name + ".wasm"));
        }
        return out;
    }

    std::vector<std::string> builtNames() const
    {
        std::vector<std::string> out;
        for (const auto &config : built)
        {
            out.push_back(config.target.name);
        }
        return out;
    }
};

class FakePostProcessor : public build::ArtifactPostProcessor {
public:
    std::vector<std::filesystem::path> seen;

    std::vector<std::filesystem::path> process(
        const build::BuildConfiguration &config,
        const std::filesystem::path &artifact) override
    {
        seen.push_back(artifact);
        if (config.triplet != build::Triplet::WasmNative)
        {
            return {};
        }
        std::filesystem::path loader = artifact;
        loader.replace_extension(".js");
        return {loader};
    }
};

class FakeBrowser : public test::BrowserHarness {
public:
    std::set<std::string> failing;
    std::vector<std::string> ran;
    std::vector<std::string> lastPassthrough;

    core::Result<bool> run(
        const build::BuildConfiguration &config,
        const build::BuildResult &,
        const std::vector<std::string> &passthrough) override
    {
        ran.push_back(config.target.name);
        lastPassthrough = passthrough;
        return core::Result<bool>::ok(failing.count(config.target.name) == 0);
    }
};

class FakeScriptRuntime : public test::ScriptRuntime {
public:
    struct Call {
        std::string executable;
        std::vector<std::string> args;
        std::filesystem::path cwd;
    };

    std::optional<std::string> executable = std::string("node");
    std::set<std::string> failingScripts;
    std::vector<Call> calls;

    std::optional<std::string> locate() const override
    {
        return executable;
    }

    int run(const std::string &exe, const std::vector<std::string> &args) override
    {
        calls.push_back(Call{exe, args, std::filesystem::current_path()});
        if (!args.empty() && failingScripts.count(std::filesystem::path(args.front()).stem().string()) != 0)
        {
            return 1;
        }
        return 0;
    }
};

} // namespace webpilot::testing

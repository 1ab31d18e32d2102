#include "build/config_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "io/env.hpp"

namespace webpilot::build {
namespace {

constexpr const char *kIncrementalVariable = "CARGO_INCREMENTAL";

bool containsWhitespace(const std::string &value) {
    return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

void pushFlagPair(std::vector<std::string> &flags, const std::string &value) {
    flags.push_back("-C");
    flags.push_back(value);
}

} // namespace

Triplet resolveTriplet(const BuildFlags &flags) {
    if (flags.targetNativeWasm) {
        return Triplet::WasmNative;
    }
    if (flags.targetEmscriptenWasm) {
        return Triplet::WasmEmscripten;
    }
    return Triplet::AsmJsEmscripten;
}

BuildType requestedBuildType(const BuildFlags &flags) {
    return flags.release ? BuildType::Release : BuildType::Debug;
}

BuildType resolveBuildType(BuildType requested, Triplet triplet, const webpilot::Context &ctx) {
    if (triplet == Triplet::WasmNative && requested == BuildType::Debug) {
        ctx.warn("debug builds on the ", tripletName(triplet), " target are currently totally broken");
        ctx.warn("forcing a release build");
        return BuildType::Release;
    }
    return requested;
}

ToolchainAugmentation augmentForToolchain(
    Triplet triplet,
    BuildType requested,
    Profile profile,
    bool useSystemEmscripten,
    ToolchainProvisioner &provisioner
) {
    ToolchainAugmentation out;

    if (isEmscripten(triplet)) {
        if (auto emscripten = provisioner.provision(useSystemEmscripten, isWasm(triplet))) {
            out.paths.push_back(emscripten->root);

            const std::string llvm = emscripten->llvm.string();
            out.environment.emplace_back("EMSCRIPTEN", emscripten->root.string());
            out.environment.emplace_back("EMSCRIPTEN_FASTCOMP", llvm);
            out.environment.emplace_back("LLVM", llvm);
            if (emscripten->binaryen.has_value()) {
                out.environment.emplace_back("BINARYEN", emscripten->binaryen->string());
            }
        }

        // Tests need the exit runtime; everything else is smaller without it.
        const int noExitRuntime = profile == Profile::Test ? 0 : 1;
        pushFlagPair(out.flags, "link-arg=-s");
        pushFlagPair(out.flags, "link-arg=NO_EXIT_RUNTIME=" + std::to_string(noExitRuntime));
    }

    if (triplet == Triplet::WasmNative && requested == BuildType::Debug) {
        pushFlagPair(out.flags, "debuginfo=2");
    }

    if (triplet == Triplet::WasmNative && io::envValue(kIncrementalVariable).has_value()) {
        out.environment.emplace_back(kIncrementalVariable, "0");
    }

    return out;
}

void applyUserLinkArgs(
    std::vector<std::string> &flags,
    const std::vector<std::string> &linkArgs,
    const webpilot::Context &ctx
) {
    for (const auto &arg : linkArgs) {
        if (containsWhitespace(arg)) {
            ctx.error("you have a space in one of the entries in `link-args` in your `web.json`;");
            ctx.error("this is currently unsupported - aborting!");
            std::exit(kUnquotableLinkArgExitCode);
        }
        pushFlagPair(flags, "link-arg=" + arg);
    }
}

BuildConfiguration buildConfiguration(
    const webpilot::Context &ctx,
    const BuildFlags &flags,
    const model::Package &package,
    const model::PackageConfig &packageConfig,
    const model::Target &target,
    Profile profile,
    ToolchainProvisioner &provisioner
) {
    const Triplet triplet = resolveTriplet(flags);
    const BuildType requested = requestedBuildType(flags);

    ToolchainAugmentation augmentation =
        augmentForToolchain(triplet, requested, profile, flags.useSystemEmscripten, provisioner);
    if (packageConfig.linkArgs.has_value()) {
        applyUserLinkArgs(augmentation.flags, packageConfig.linkArgs.value(), ctx);
    }

    BuildConfiguration config;
    config.target = BuildTarget{target.kind, target.name, profile};
    config.triplet = triplet;
    config.buildType = resolveBuildType(requested, triplet, ctx);
    config.package = package.name;
    config.features = flags.features;
    config.noDefaultFeatures = flags.noDefaultFeatures;
    config.allFeatures = flags.allFeatures;
    config.extraPaths = std::move(augmentation.paths);
    config.extraFlags = std::move(augmentation.flags);
    config.extraEnvironment = std::move(augmentation.environment);
    config.messageFormat = flags.messageFormat;
    config.verbose = flags.verbose;
    return config;
}

} // namespace webpilot::build

#include "build/cargo_toolchain.hpp"

#include <algorithm>
#include <iostream>

#include "io/env.hpp"
#include "io/json_reader.hpp"
#include "io/process.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace webpilot::build {
namespace {

std::string normalizeTargetName(std::string value) {
    std::replace(value.begin(), value.end(), '-', '_');
    return value;
}

void appendTargetSelection(std::vector<std::string> &args, const BuildTarget &target) {
    switch (target.kind) {
    case model::TargetKind::Lib:
        args.push_back("--lib");
        return;
    case model::TargetKind::Bin:
        args.push_back("--bin");
        break;
    case model::TargetKind::Example:
        args.push_back("--example");
        break;
    case model::TargetKind::Bench:
        args.push_back("--bench");
        break;
    case model::TargetKind::Test:
        args.push_back("--test");
        break;
    }
    args.push_back(target.name);
}

std::string joinFlags(const std::vector<std::string> &flags) {
    std::string out;
    for (const auto &flag : flags) {
        if (!out.empty()) {
            out += ' ';
        }
        out += flag;
    }
    return out;
}

// Test builds also compile the library as a plain dependency of binaries and
// integration tests; only the test harness build is wanted then.
bool matchesProfile(const json &message, const BuildTarget &wanted) {
    if (wanted.profile != Profile::Test || !message.contains("profile")) {
        return true;
    }
    const json &profile = message["profile"];
    if (!profile.is_object() || !profile.contains("test") || !profile["test"].is_boolean()) {
        return true;
    }
    return profile["test"].get<bool>();
}

bool matchesTarget(const json &target, const BuildTarget &wanted) {
    if (!target.is_object()) {
        return false;
    }

    std::vector<std::string> kinds;
    for (const auto &kind : target.value("kind", json::array())) {
        if (kind.is_string()) {
            kinds.push_back(kind.get<std::string>());
        }
    }
    const auto kind = model::targetKindFromMetadata(kinds);
    if (!kind.has_value() || kind.value() != wanted.kind) {
        return false;
    }
    return normalizeTargetName(target.value("name", std::string())) == normalizeTargetName(wanted.name);
}

std::string prependedPath(const std::vector<fs::path> &extraPaths) {
    std::string out;
    for (const auto &path : extraPaths) {
        out += path.string();
        out += io::pathListSeparator();
    }
    out += io::envValue("PATH").value_or("");
    return out;
}

} // namespace

std::vector<std::string> cargoArguments(const BuildConfiguration &config) {
    const bool testBuild = config.target.profile == Profile::Test;

    std::vector<std::string> args;
    if (testBuild) {
        args.push_back("test");
        args.push_back("--no-run");
    } else {
        args.push_back("rustc");
    }
    args.push_back("--package");
    args.push_back(config.package);
    args.push_back("--target");
    args.push_back(tripletName(config.triplet));
    args.push_back("--message-format");
    args.push_back("json");

    appendTargetSelection(args, config.target);

    if (config.buildType == BuildType::Release) {
        args.push_back("--release");
    }
    if (!config.features.empty()) {
        args.push_back("--features");
        args.push_back(joinFlags(config.features));
    }
    if (config.noDefaultFeatures) {
        args.push_back("--no-default-features");
    }
    if (config.allFeatures) {
        args.push_back("--all-features");
    }
    if (config.verbose) {
        args.push_back("--verbose");
    }

    // `cargo test` has no way to pass flags to the final rustc invocation;
    // those go through RUSTFLAGS instead.
    if (!testBuild && !config.extraFlags.empty()) {
        args.push_back("--");
        args.insert(args.end(), config.extraFlags.begin(), config.extraFlags.end());
    }
    return args;
}

io::EnvironmentPairs cargoEnvironment(const BuildConfiguration &config) {
    io::EnvironmentPairs environment = config.extraEnvironment;
    if (!config.extraPaths.empty()) {
        environment.emplace_back("PATH", prependedPath(config.extraPaths));
    }
    if (config.target.profile == Profile::Test && !config.extraFlags.empty()) {
        std::string rustflags = io::envValue("RUSTFLAGS").value_or("");
        if (!rustflags.empty()) {
            rustflags += ' ';
        }
        rustflags += joinFlags(config.extraFlags);
        environment.emplace_back("RUSTFLAGS", rustflags);
    }
    return environment;
}

std::vector<fs::path> collectArtifacts(
    const std::vector<json> &messages,
    const BuildConfiguration &config,
    const webpilot::Context &ctx
) {
    std::vector<fs::path> out;
    for (const auto &message : messages) {
        if (config.messageFormat == MessageFormat::Json) {
            std::cout << message.dump() << '\n';
        }

        const std::string reason = message.value("reason", std::string());
        if (reason == "compiler-message") {
            if (config.messageFormat == MessageFormat::Human && message.contains("message")) {
                const json &diagnostic = message["message"];
                if (diagnostic.is_object() && diagnostic.contains("rendered") && diagnostic["rendered"].is_string()) {
                    std::cerr << diagnostic["rendered"].get<std::string>();
                }
            }
            continue;
        }
        if (reason != "compiler-artifact" || !message.contains("target")) {
            continue;
        }
        if (!matchesTarget(message["target"], config.target) || !matchesProfile(message, config.target)) {
            continue;
        }

        for (const auto &file : message.value("filenames", json::array())) {
            if (!file.is_string()) {
                continue;
            }
            fs::path artifact(file.get<std::string>());
            if (std::find(out.begin(), out.end(), artifact) == out.end()) {
                ctx.debug("Artifact: ", artifact.string());
                out.push_back(std::move(artifact));
            }
        }
    }
    return out;
}

CargoToolchain::CargoToolchain(const webpilot::Context &ctx) : ctx_(ctx) {}

std::optional<std::vector<fs::path>> CargoToolchain::build(const BuildConfiguration &config) {
    const std::string cargo = io::envValue("CARGO").value_or("cargo");

    io::CapturedProcess captured;
    {
        const io::ScopedEnvironment scope(cargoEnvironment(config), ctx_);
        captured = io::runCommandCapture(cargo, cargoArguments(config), {}, ctx_);
    }

    const auto artifacts = collectArtifacts(io::parseJsonLines(captured.output), config, ctx_);
    if (captured.process.code != 0) {
        return std::nullopt;
    }
    if (artifacts.empty()) {
        ctx_.warn("The build of `", config.target.name, "` reported no artifacts");
    }
    return artifacts;
}

} // namespace webpilot::build

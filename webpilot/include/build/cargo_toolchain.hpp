#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "build/build_executor.hpp"
#include "core/context.hpp"
#include "io/env.hpp"
#include "nlohmann/json.hpp"

namespace webpilot::build {

// Main builds go through `cargo rustc`; test builds through
// `cargo test --no-run`, which accepts --release together with the test harness.
std::vector<std::string> cargoArguments(const BuildConfiguration &config);

// Variables exported to cargo: the toolchain environment, PATH with the extra
// search paths in front, and RUSTFLAGS carrying the extra flags of test builds.
io::EnvironmentPairs cargoEnvironment(const BuildConfiguration &config);

// Picks the artifacts of the configured target out of the JSON message
// stream and echoes compiler diagnostics in the requested format.
std::vector<std::filesystem::path> collectArtifacts(
    const std::vector<nlohmann::json> &messages,
    const BuildConfiguration &config,
    const webpilot::Context &ctx
);

class CargoToolchain : public Toolchain {
public:
    explicit CargoToolchain(const webpilot::Context &ctx);

    std::optional<std::vector<std::filesystem::path>> build(const BuildConfiguration &config) override;

private:
    const webpilot::Context &ctx_;
};

} // namespace webpilot::build

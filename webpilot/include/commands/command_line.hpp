#pragma once

#include <optional>
#include <string>
#include <vector>

#include "build/config.hpp"
#include "build/target_resolver.hpp"
#include "core/context.hpp"
#include "core/error.hpp"

namespace webpilot::commands {

constexpr int kErrorExitCode = 101;

struct CommandLine {
    std::optional<std::string> package;
    build::TargetSelector selector;
    build::BuildFlags flags;
    bool nodejs = false;
    bool noRun = false;
    std::vector<std::string> passthrough;
};

// Test-only flags (--nodejs, --no-run, trailing arguments) are rejected
// unless allowTestFlags is set. Conflicting selectors or target flags are a
// configuration error.
core::Result<CommandLine> parseCommandLine(const std::vector<std::string> &args, bool allowTestFlags);

// Prints the error the way the command line reports it and returns the exit
// status that goes with it.
int reportError(const webpilot::Context &ctx, const core::Error &error);

} // namespace webpilot::commands

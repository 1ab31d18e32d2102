#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace webpilot::io {

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    long long processId = -1;
};

struct CapturedProcess {
    ProcessResult process;
    std::string output;
};

std::string shellQuote(const std::string &value);

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx
);

// Runs the command and collects its standard output; standard error stays
// attached to the terminal.
CapturedProcess runCommandCapture(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx
);

std::optional<std::filesystem::path> findExecutable(const std::string &name);

} // namespace webpilot::io

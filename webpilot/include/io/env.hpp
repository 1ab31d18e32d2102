#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/context.hpp"

namespace webpilot::io {

using EnvironmentPairs = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string> envValue(const std::string &name);
bool setEnvValue(const std::string &name, const std::string &value);
bool unsetEnvValue(const std::string &name);

char pathListSeparator();

// Applies variables to the current process and puts the old values back on
// destruction. Variables the process refuses are reported and skipped.
class ScopedEnvironment {
public:
    ScopedEnvironment(const EnvironmentPairs &values, const webpilot::Context &ctx);
    ~ScopedEnvironment();

    ScopedEnvironment(const ScopedEnvironment &) = delete;
    ScopedEnvironment &operator=(const ScopedEnvironment &) = delete;

private:
    const webpilot::Context &ctx_;
    std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

} // namespace webpilot::io

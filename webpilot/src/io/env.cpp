#include "io/env.hpp"

#include <cstdlib>
#include <utility>

namespace webpilot::io {

std::optional<std::string> envValue(const std::string &name) {
    const char *value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

bool setEnvValue(const std::string &name, const std::string &value) {
#ifdef _WIN32
    return _putenv_s(name.c_str(), value.c_str()) == 0;
#else
    return setenv(name.c_str(), value.c_str(), 1) == 0;
#endif
}

bool unsetEnvValue(const std::string &name) {
#ifdef _WIN32
    return _putenv_s(name.c_str(), "") == 0;
#else
    return unsetenv(name.c_str()) == 0;
#endif
}

char pathListSeparator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

ScopedEnvironment::ScopedEnvironment(const EnvironmentPairs &values, const webpilot::Context &ctx) : ctx_(ctx) {
    saved_.reserve(values.size());
    for (const auto &[name, value] : values) {
        std::optional<std::string> previous = envValue(name);
        if (!setEnvValue(name, value)) {
            ctx_.warn("Failed to set environment variable ", name);
            continue;
        }
        saved_.emplace_back(name, std::move(previous));
    }
}

ScopedEnvironment::~ScopedEnvironment() {
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
        const bool restored = it->second.has_value()
            ? setEnvValue(it->first, it->second.value())
            : unsetEnvValue(it->first);
        if (!restored) {
            ctx_.warn("Failed to restore environment variable ", it->first);
        }
    }
}

} // namespace webpilot::io

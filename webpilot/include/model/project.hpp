#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpilot::model {

enum class TargetKind {
    Lib,
    Bin,
    Example,
    Bench,
    Test,
};

struct Target {
    TargetKind kind = TargetKind::Lib;
    std::string name;
};

struct Package {
    std::string name;
    std::filesystem::path manifestDir;
    std::vector<Target> targets;
};

struct Project {
    std::filesystem::path workspaceRoot;
    std::vector<Package> packages;
    std::size_t defaultPackage = 0;
};

// Settings a package declares in its `web.json`.
struct PackageConfig {
    std::optional<std::vector<std::string>> linkArgs;
};

inline const char *targetKindName(TargetKind kind)
{
    switch (kind)
    {
    case TargetKind::Lib:
        return "lib";
    case TargetKind::Bin:
        return "bin";
    case TargetKind::Example:
        return "example";
    case TargetKind::Bench:
        return "bench";
    case TargetKind::Test:
        return "test";
    }
    return "unknown";
}

} // namespace webpilot::model

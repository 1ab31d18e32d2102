#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/error.hpp"
#include "model/project.hpp"

namespace webpilot::build {

struct LibrarySelector {};

struct BinarySelector {
    std::string name;
};

struct ExampleSelector {
    std::string name;
};

struct BenchSelector {
    std::string name;
};

// At most one explicit target; std::monostate means "apply the default filter".
using TargetSelector = std::variant<std::monostate, LibrarySelector, BinarySelector, ExampleSelector, BenchSelector>;
using TargetFilter = std::function<bool(const model::Target &)>;

core::Result<model::Package> selectPackage(const model::Project &project, const std::optional<std::string> &name);

core::Result<std::vector<model::Target>> selectTargets(
    const model::Package &package,
    const TargetSelector &selector,
    const TargetFilter &filter
);

} // namespace webpilot::build

#include "build/target_resolver.hpp"

#include <algorithm>
#include <iterator>

namespace webpilot::build
{

    namespace
    {

        using model::Target;
        using model::TargetKind;

        core::Result<std::vector<Target>> findNamed(
            const model::Package &package,
            TargetKind kind,
            const std::string &name,
            const char *label)
        {
            const auto it = std::find_if(package.targets.begin(), package.targets.end(), [&](const Target &target)
                                         { return target.kind == kind && target.name == name; });
            if (it == package.targets.end())
            {
                return core::Result<std::vector<Target>>::error(
                    core::Error::configuration(std::string("no ") + label + " target named `" + name + "`"));
            }
            return core::Result<std::vector<Target>>::ok({*it});
        }

    } // namespace

    core::Result<model::Package> selectPackage(const model::Project &project, const std::optional<std::string> &name)
    {
        if (name.has_value())
        {
            const auto it = std::find_if(project.packages.begin(), project.packages.end(), [&](const model::Package &package)
                                         { return package.name == name.value(); });
            if (it == project.packages.end())
            {
                return core::Result<model::Package>::error(
                    core::Error::configuration("package `" + name.value() + "` not found"));
            }
            return core::Result<model::Package>::ok(*it);
        }

        if (project.defaultPackage >= project.packages.size())
        {
            return core::Result<model::Package>::error(core::Error::configuration("project has no packages"));
        }
        return core::Result<model::Package>::ok(project.packages[project.defaultPackage]);
    }

    core::Result<std::vector<Target>> selectTargets(
        const model::Package &package,
        const TargetSelector &selector,
        const TargetFilter &filter)
    {
        if (std::holds_alternative<LibrarySelector>(selector))
        {
            const auto it = std::find_if(package.targets.begin(), package.targets.end(), [](const Target &target)
                                         { return target.kind == TargetKind::Lib; });
            if (it == package.targets.end())
            {
                return core::Result<std::vector<Target>>::error(core::Error::configuration("no library targets found"));
            }
            return core::Result<std::vector<Target>>::ok({*it});
        }
        if (const auto *bin = std::get_if<BinarySelector>(&selector))
        {
            return findNamed(package, TargetKind::Bin, bin->name, "bin");
        }
        if (const auto *example = std::get_if<ExampleSelector>(&selector))
        {
            return findNamed(package, TargetKind::Example, example->name, "example");
        }
        if (const auto *bench = std::get_if<BenchSelector>(&selector))
        {
            return findNamed(package, TargetKind::Bench, bench->name, "bench");
        }

        std::vector<Target> out;
        std::copy_if(package.targets.begin(), package.targets.end(), std::back_inserter(out), filter);
        return core::Result<std::vector<Target>>::ok(std::move(out));
    }

} // namespace webpilot::build

#include "model/loader.hpp"

#include <algorithm>
#include <exception>

#include "io/env.hpp"
#include "io/json_reader.hpp"
#include "io/process.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace webpilot::model
{

    namespace
    {

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }

            for (const auto &item : node)
            {
                if (!item.is_string())
                {
                    continue;
                }
                std::string value = item.get<std::string>();
                if (!value.empty())
                {
                    out.push_back(value);
                }
            }
            return out;
        }

        bool contains(const std::vector<std::string> &items, const std::string &value)
        {
            return std::find(items.begin(), items.end(), value) != items.end();
        }

        std::optional<Package> parsePackage(const json &node, const webpilot::Context &ctx)
        {
            if (!node.is_object() || !node.contains("name") || !node["name"].is_string())
            {
                ctx.warn("Skipping package entry without a name");
                return std::nullopt;
            }

            Package package;
            package.name = node["name"].get<std::string>();

            const std::string manifest = node.value("manifest_path", std::string());
            if (!manifest.empty())
            {
                package.manifestDir = fs::path(manifest).parent_path();
            }

            const json targets = node.value("targets", json::array());
            for (const auto &entry : targets)
            {
                if (!entry.is_object())
                {
                    continue;
                }
                const auto kind = targetKindFromMetadata(toStringList(entry.value("kind", json::array())));
                if (!kind.has_value())
                {
                    continue;
                }

                Target target;
                target.kind = kind.value();
                target.name = entry.value("name", std::string());
                package.targets.push_back(target);
            }
            return package;
        }

        // Linker arguments are passed on verbatim, so a malformed list is
        // dropped as a whole rather than entry by entry.
        std::optional<std::vector<std::string>> readLinkArgs(
            const json &node,
            const fs::path &configPath,
            const webpilot::Context &ctx)
        {
            if (!node.is_array())
            {
                ctx.warn("`link-args` in ", configPath.string(), " is not an array; ignoring it");
                return std::nullopt;
            }

            std::vector<std::string> out;
            for (const auto &item : node)
            {
                if (!item.is_string() || item.get<std::string>().empty())
                {
                    ctx.warn("`link-args` in ", configPath.string(), " has an entry that is not a non-empty string (",
                             item.dump(), "); ignoring it");
                    return std::nullopt;
                }
                out.push_back(item.get<std::string>());
            }
            return out;
        }

    } // namespace

    std::optional<TargetKind> targetKindFromMetadata(const std::vector<std::string> &kinds)
    {
        static const std::vector<std::string> libraryKinds = {
            "lib", "rlib", "dylib", "cdylib", "staticlib", "proc-macro",
        };

        for (const auto &kind : kinds)
        {
            if (contains(libraryKinds, kind))
            {
                return TargetKind::Lib;
            }
        }
        if (contains(kinds, "bin"))
        {
            return TargetKind::Bin;
        }
        if (contains(kinds, "example"))
        {
            return TargetKind::Example;
        }
        if (contains(kinds, "bench"))
        {
            return TargetKind::Bench;
        }
        if (contains(kinds, "test"))
        {
            return TargetKind::Test;
        }
        // custom-build and friends never take part in a web build.
        return std::nullopt;
    }

    std::optional<Project> loadProjectMetadata(const json &metadata, const webpilot::Context &ctx)
    {
        if (!metadata.is_object() || !metadata.contains("packages") || !metadata["packages"].is_array())
        {
            ctx.error("Project metadata has no package list");
            return std::nullopt;
        }

        Project project;
        project.workspaceRoot = fs::path(metadata.value("workspace_root", std::string()));

        for (const auto &node : metadata["packages"])
        {
            auto package = parsePackage(node, ctx);
            if (package.has_value())
            {
                project.packages.push_back(std::move(package.value()));
            }
        }

        if (project.packages.empty())
        {
            ctx.error("Project metadata lists no packages");
            return std::nullopt;
        }

        project.defaultPackage = 0;
        if (!project.workspaceRoot.empty())
        {
            const fs::path root = project.workspaceRoot.lexically_normal();
            for (std::size_t i = 0; i < project.packages.size(); ++i)
            {
                if (project.packages[i].manifestDir.lexically_normal() == root)
                {
                    project.defaultPackage = i;
                    break;
                }
            }
        }
        return project;
    }

    std::optional<Project> queryProjectMetadata(const webpilot::Context &ctx, const fs::path &manifestDir)
    {
        const std::string cargo = io::envValue("CARGO").value_or("cargo");
        const auto captured = io::runCommandCapture(
            cargo,
            {"metadata", "--format-version", "1", "--no-deps"},
            manifestDir,
            ctx);
        if (captured.process.code != 0)
        {
            ctx.error("Failed to read project metadata: ", captured.process.commandLine);
            return std::nullopt;
        }

        json metadata = json::parse(captured.output, nullptr, false);
        if (metadata.is_discarded())
        {
            ctx.error("Project metadata is not valid JSON");
            return std::nullopt;
        }
        return loadProjectMetadata(metadata, ctx);
    }

    PackageConfig loadPackageConfig(const fs::path &manifestDir, const webpilot::Context &ctx)
    {
        PackageConfig config;
        const fs::path configPath = manifestDir / kPackageConfigFile;

        std::error_code ec;
        if (manifestDir.empty() || !fs::exists(configPath, ec))
        {
            return config;
        }

        try
        {
            json data = io::loadJsonFile(configPath);
            if (data.contains("link-args"))
            {
                config.linkArgs = readLinkArgs(data["link-args"], configPath, ctx);
            }
        }
        catch (const std::exception &e)
        {
            ctx.warn("Ignoring ", configPath.string(), ": ", e.what());
        }
        return config;
    }

} // namespace webpilot::model

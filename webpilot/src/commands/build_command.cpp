#include "commands/build_command.hpp"

#include "build/cargo_toolchain.hpp"
#include "build/config_builder.hpp"
#include "build/target_resolver.hpp"
#include "build/wasm_loader.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace webpilot::commands
{
    namespace
    {

        bool isBuildableByDefault(const model::Target &target)
        {
            return target.kind == model::TargetKind::Lib || target.kind == model::TargetKind::Bin;
        }

    } // namespace

    int executeBuild(
        const webpilot::Context &ctx,
        const model::Project &project,
        BuildServices services,
        const CommandLine &commandLine)
    {
        const auto package = build::selectPackage(project, commandLine.package);
        if (!package)
        {
            return reportError(ctx, package.error());
        }

        const auto targets = build::selectTargets(package.value(), commandLine.selector, isBuildableByDefault);
        if (!targets)
        {
            return reportError(ctx, targets.error());
        }
        if (targets.value().empty())
        {
            ctx.warn("Nothing to build in package ", package.value().name);
            return 0;
        }

        const model::PackageConfig packageConfig = model::loadPackageConfig(package.value().manifestDir, ctx);
        const build::BuildExecutor executor(ctx, services.toolchain, services.postProcessor);

        for (const auto &target : targets.value())
        {
            const build::BuildConfiguration config = build::buildConfiguration(
                ctx,
                commandLine.flags,
                package.value(),
                packageConfig,
                target,
                build::Profile::Main,
                services.provisioner);

            const auto result = executor.run(config);
            if (!result)
            {
                return reportError(ctx, result.error());
            }
            for (const auto &artifact : result.value().artifacts)
            {
                ctx.log("  ", artifact.string());
            }
        }
        return 0;
    }

    int runBuildCommand(const webpilot::Context &ctx, const fs::path &projectDir, const std::vector<std::string> &args)
    {
        const auto commandLine = parseCommandLine(args, false);
        if (!commandLine)
        {
            return reportError(ctx, commandLine.error());
        }

        const webpilot::Context runCtx(commandLine.value().flags.verbose);
        const auto project = model::queryProjectMetadata(runCtx, projectDir);
        if (!project.has_value())
        {
            return kErrorExitCode;
        }

        build::LocalEmscriptenProvisioner provisioner(runCtx);
        build::CargoToolchain toolchain(runCtx);
        build::WasmLoaderGenerator postProcessor(runCtx);

        return executeBuild(
            runCtx,
            project.value(),
            BuildServices{provisioner, toolchain, postProcessor},
            commandLine.value());
    }

} // namespace webpilot::commands

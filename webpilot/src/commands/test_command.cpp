#include "commands/test_command.hpp"

#include <utility>

#include "build/cargo_toolchain.hpp"
#include "build/emscripten.hpp"
#include "build/wasm_loader.hpp"
#include "model/loader.hpp"
#include "test/browser_harness.hpp"
#include "test/script_runtime.hpp"

namespace fs = std::filesystem;

namespace webpilot::commands
{

    int executeTests(
        const webpilot::Context &ctx,
        const model::Project &project,
        test::TestServices services,
        const CommandLine &commandLine)
    {
        test::TestOptions options;
        options.package = commandLine.package;
        options.selector = commandLine.selector;
        options.flags = commandLine.flags;
        options.runtime = commandLine.nodejs ? test::TestRuntime::Script : test::TestRuntime::Browser;
        options.noRun = commandLine.noRun;
        options.passthrough = commandLine.passthrough;

        test::TestDispatcher dispatcher(ctx, project, services, std::move(options));
        const auto status = dispatcher.run();
        if (!status)
        {
            return reportError(ctx, status.error());
        }
        return status.value();
    }

    int runTestCommand(const webpilot::Context &ctx, const fs::path &projectDir, const std::vector<std::string> &args)
    {
        const auto commandLine = parseCommandLine(args, true);
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
        test::ChromiumHarness browser(runCtx);
        test::NodeRuntime script(runCtx);

        return executeTests(
            runCtx,
            project.value(),
            test::TestServices{provisioner, toolchain, postProcessor, browser, script},
            commandLine.value());
    }

} // namespace webpilot::commands

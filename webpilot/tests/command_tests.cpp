#include <algorithm>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "commands/build_command.hpp"
#include "commands/command_line.hpp"
#include "commands/test_command.hpp"
#include "support/fakes.hpp"

using webpilot::commands::CommandLine;
using webpilot::commands::parseCommandLine;
using webpilot::model::TargetKind;

namespace
{

    webpilot::model::Project makeProject()
    {
        webpilot::model::Package app;
        app.name = "app";
        app.targets = {
            {TargetKind::Lib, "app"},
            {TargetKind::Bin, "tool"},
            {TargetKind::Example, "demo"},
            {TargetKind::Test, "smoke"},
        };

        webpilot::model::Project project;
        project.packages = {app};
        return project;
    }

} // namespace

TEST(ParseCommandLine, ReadsBuildFlags)
{
    const auto parsed = parseCommandLine(
        {"-p", "app", "--bin", "tool", "--target-webasm-emscripten", "--features", "a b", "--release",
         "--use-system-emscripten", "--message-format", "JSON", "-v"},
        false);
    ASSERT_TRUE(parsed.isOk());

    const CommandLine &line = parsed.value();
    EXPECT_EQ(line.package.value_or(""), "app");
    ASSERT_TRUE(std::holds_alternative<webpilot::build::BinarySelector>(line.selector));
    EXPECT_EQ(std::get<webpilot::build::BinarySelector>(line.selector).name, "tool");
    EXPECT_TRUE(line.flags.targetEmscriptenWasm);
    EXPECT_FALSE(line.flags.targetNativeWasm);
    EXPECT_EQ(line.flags.features, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(line.flags.release);
    EXPECT_TRUE(line.flags.useSystemEmscripten);
    EXPECT_EQ(line.flags.messageFormat, webpilot::build::MessageFormat::Json);
    EXPECT_TRUE(line.flags.verbose);
}

TEST(ParseCommandLine, TestFlagsAndPassthrough)
{
    const auto parsed = parseCommandLine({"--nodejs", "--no-run", "--lib", "--", "--nocapture", "--lib"}, true);
    ASSERT_TRUE(parsed.isOk());
    EXPECT_TRUE(parsed.value().nodejs);
    EXPECT_TRUE(parsed.value().noRun);
    EXPECT_TRUE(std::holds_alternative<webpilot::build::LibrarySelector>(parsed.value().selector));
    EXPECT_EQ(parsed.value().passthrough, (std::vector<std::string>{"--nocapture", "--lib"}));
}

TEST(ParseCommandLine, TestFlagsAreRejectedForBuild)
{
    EXPECT_FALSE(parseCommandLine({"--nodejs"}, false).isOk());
    EXPECT_FALSE(parseCommandLine({"--no-run"}, false).isOk());
    EXPECT_FALSE(parseCommandLine({"--", "x"}, false).isOk());
}

TEST(ParseCommandLine, ConflictingSelectorsAreRejected)
{
    const auto parsed = parseCommandLine({"--lib", "--bin", "tool"}, true);
    ASSERT_FALSE(parsed.isOk());
    EXPECT_EQ(parsed.error().kind, webpilot::core::ErrorKind::Configuration);
    EXPECT_EQ(parsed.error().message, "only one of --lib, --bin, --example and --bench may be given");
}

TEST(ParseCommandLine, ConflictingTargetsAreRejected)
{
    EXPECT_FALSE(parseCommandLine({"--target-webasm", "--target-webasm-emscripten"}, true).isOk());
    EXPECT_FALSE(parseCommandLine({"--target-asmjs-emscripten", "--target-webasm"}, true).isOk());
    EXPECT_TRUE(parseCommandLine({"--target-asmjs-emscripten"}, true).isOk());
}

TEST(ParseCommandLine, MalformedArguments)
{
    EXPECT_FALSE(parseCommandLine({"--bin"}, true).isOk());
    EXPECT_FALSE(parseCommandLine({"--message-format", "xml"}, true).isOk());
    EXPECT_FALSE(parseCommandLine({"--frobnicate"}, true).isOk());
}

TEST(ReportError, EveryErrorMapsToFailureStatus)
{
    const webpilot::Context ctx(false);
    EXPECT_EQ(webpilot::commands::reportError(ctx, webpilot::core::Error::configuration("bad")), 101);
    EXPECT_EQ(webpilot::commands::reportError(ctx, webpilot::core::Error::build()), 101);
}

TEST(ExecuteBuild, BuildsLibraryAndBinariesWithMainProfile)
{
    const webpilot::Context ctx(false);
    webpilot::testing::FakeProvisioner provisioner;
    webpilot::testing::FakeToolchain toolchain;
    webpilot::testing::FakePostProcessor postProcessor;

    const int status = webpilot::commands::executeBuild(
        ctx, makeProject(), webpilot::commands::BuildServices{provisioner, toolchain, postProcessor}, CommandLine{});
    EXPECT_EQ(status, 0);
    EXPECT_EQ(toolchain.builtNames(), (std::vector<std::string>{"app", "tool"}));
    for (const auto &config : toolchain.built)
    {
        EXPECT_EQ(config.target.profile, webpilot::build::Profile::Main);
        EXPECT_NE(std::find(config.extraFlags.begin(), config.extraFlags.end(), "link-arg=NO_EXIT_RUNTIME=1"),
                  config.extraFlags.end());
    }
}

TEST(ExecuteBuild, ExplicitExampleIsBuilt)
{
    const webpilot::Context ctx(false);
    webpilot::testing::FakeProvisioner provisioner;
    webpilot::testing::FakeToolchain toolchain;
    webpilot::testing::FakePostProcessor postProcessor;

    CommandLine line;
    line.selector = webpilot::build::ExampleSelector{"demo"};
    const int status = webpilot::commands::executeBuild(
        ctx, makeProject(), webpilot::commands::BuildServices{provisioner, toolchain, postProcessor}, line);
    EXPECT_EQ(status, 0);
    EXPECT_EQ(toolchain.builtNames(), (std::vector<std::string>{"demo"}));
}

TEST(ExecuteBuild, FailureStopsAndReturnsErrorStatus)
{
    const webpilot::Context ctx(false);
    webpilot::testing::FakeProvisioner provisioner;
    webpilot::testing::FakeToolchain toolchain;
    toolchain.failing = {"app"};
    webpilot::testing::FakePostProcessor postProcessor;

    const int status = webpilot::commands::executeBuild(
        ctx, makeProject(), webpilot::commands::BuildServices{provisioner, toolchain, postProcessor}, CommandLine{});
    EXPECT_EQ(status, webpilot::commands::kErrorExitCode);
    EXPECT_EQ(toolchain.builtNames(), (std::vector<std::string>{"app"}));
}

TEST(ExecuteTests, NodejsFlagSelectsScriptRuntime)
{
    const webpilot::Context ctx(false);
    webpilot::testing::FakeProvisioner provisioner;
    webpilot::testing::FakeToolchain toolchain;
    webpilot::testing::FakePostProcessor postProcessor;
    webpilot::testing::FakeBrowser browser;
    webpilot::testing::FakeScriptRuntime script;

    auto line = parseCommandLine({"--target-webasm", "--nodejs", "--no-run"}, true);
    ASSERT_TRUE(line.isOk());
    const int status = webpilot::commands::executeTests(
        ctx, makeProject(),
        webpilot::test::TestServices{provisioner, toolchain, postProcessor, browser, script},
        line.value());
    EXPECT_EQ(status, 0);
    EXPECT_EQ(toolchain.built.size(), 3U);
}

TEST(ExecuteTests, NativeWasmWithoutNodejsIsAnError)
{
    const webpilot::Context ctx(false);
    webpilot::testing::FakeProvisioner provisioner;
    webpilot::testing::FakeToolchain toolchain;
    webpilot::testing::FakePostProcessor postProcessor;
    webpilot::testing::FakeBrowser browser;
    webpilot::testing::FakeScriptRuntime script;

    auto line = parseCommandLine({"--target-webasm"}, true);
    ASSERT_TRUE(line.isOk());
    const int status = webpilot::commands::executeTests(
        ctx, makeProject(),
        webpilot::test::TestServices{provisioner, toolchain, postProcessor, browser, script},
        line.value());
    EXPECT_EQ(status, webpilot::commands::kErrorExitCode);
    EXPECT_TRUE(toolchain.built.empty());
}

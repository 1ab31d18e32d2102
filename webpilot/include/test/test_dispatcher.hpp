#pragma once

#include <optional>
#include <string>
#include <vector>

#include "build/build_executor.hpp"
#include "build/config.hpp"
#include "build/emscripten.hpp"
#include "build/target_resolver.hpp"
#include "core/context.hpp"
#include "core/error.hpp"
#include "model/project.hpp"
#include "test/browser_harness.hpp"
#include "test/script_runtime.hpp"

namespace webpilot::test {

constexpr int kTestFailureExitCode = 101;

enum class TestRuntime {
    Browser,
    Script,
};

enum class DispatchState {
    ResolvingTargets,
    Building,
    NoRunExit,
    SelectingRuntime,
    Running,
    Aggregating,
    Done,
};

const char *dispatchStateName(DispatchState state);

struct TestOptions {
    std::optional<std::string> package;
    build::TargetSelector selector;
    build::BuildFlags flags;
    TestRuntime runtime = TestRuntime::Browser;
    bool noRun = false;
    std::vector<std::string> passthrough;
};

struct TestServices {
    build::ToolchainProvisioner &provisioner;
    build::Toolchain &toolchain;
    build::ArtifactPostProcessor &postProcessor;
    BrowserHarness &browser;
    ScriptRuntime &script;
};

bool isTestableTarget(const model::Target &target);

// Builds every selected target with the test profile, then runs each build
// in the chosen runtime. Builds stop at the first failure; test runs do not.
class TestDispatcher {
public:
    TestDispatcher(
        const webpilot::Context &ctx,
        const model::Project &project,
        TestServices services,
        TestOptions options
    );

    // Ok carries the process exit status.
    core::Result<int> run();

    DispatchState state() const { return state_; }
    const std::vector<DispatchState> &history() const { return history_; }

private:
    struct BuiltTarget {
        build::BuildConfiguration config;
        build::BuildResult result;
    };

    core::Result<std::vector<model::Target>> resolveTargets(model::Package &package);
    core::Result<std::vector<BuiltTarget>> buildTargets(
        const model::Package &package,
        const std::vector<model::Target> &targets
    );
    core::Result<std::string> selectRuntime();
    core::Result<bool> runTarget(const BuiltTarget &built, const std::string &scriptRuntime);
    core::Result<bool> runInScriptRuntime(const BuiltTarget &built, const std::string &scriptRuntime);
    void enter(DispatchState state);

    const webpilot::Context &ctx_;
    const model::Project &project_;
    TestServices services_;
    TestOptions options_;
    build::Triplet triplet_;
    DispatchState state_ = DispatchState::ResolvingTargets;
    std::vector<DispatchState> history_;
};

} // namespace webpilot::test

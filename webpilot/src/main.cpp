#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "commands/build_command.hpp"
#include "commands/test_command.hpp"
#include "core/context.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "webpilot";
    constexpr const char *kVersion = "0.1.0";

    void printHelp()
    {
        std::cout << kAppName << " - build and test for asm.js and WebAssembly targets\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " build [options]\n"
                  << "  " << kAppName << " test  [options] [--nodejs] [--no-run] [-- args...]\n"
                  << "\n"
                  << "Options:\n"
                  << "  -p, --package NAME              package to build\n"
                  << "  --lib | --bin NAME | --example NAME | --bench NAME\n"
                  << "  --target-asmjs-emscripten       asmjs-unknown-emscripten (default)\n"
                  << "  --target-webasm-emscripten      wasm32-unknown-emscripten\n"
                  << "  --target-webasm                 wasm32-unknown-unknown\n"
                  << "  --features \"A B\"                features to enable\n"
                  << "  --no-default-features | --all-features\n"
                  << "  --release                       optimized build\n"
                  << "  --use-system-emscripten         use the Emscripten on PATH\n"
                  << "  --message-format human|json\n"
                  << "  -v, --verbose\n"
                  << "\n"
                  << "Test options:\n"
                  << "  --nodejs                        run tests under Node.js instead of a headless browser\n"
                  << "  --no-run                        build the tests but do not run them\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::string command = argv[1];
    const webpilot::Context ctx(false);

    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-V")
    {
        std::cout << kAppName << ' ' << kVersion << '\n';
        return 0;
    }

    std::error_code ec;
    const fs::path projectDir = fs::current_path(ec);
    if (ec)
    {
        ctx.error("Cannot read the current directory: ", ec.message());
        return 1;
    }

    if (command == "test")
    {
        return webpilot::commands::runTestCommand(ctx, projectDir, collectArgs(argc, argv, 2));
    }
    if (command == "build")
    {
        return webpilot::commands::runBuildCommand(ctx, projectDir, collectArgs(argc, argv, 2));
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}

#include "commands/command_line.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

#include "io/json_reader.hpp"

namespace webpilot::commands
{
    namespace
    {

        using Parsed = core::Result<CommandLine>;

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        Parsed fail(const std::string &message)
        {
            return Parsed::error(core::Error::configuration(message));
        }

        bool takeValue(const std::vector<std::string> &args, std::size_t &i, std::string &value)
        {
            if (i + 1 >= args.size())
            {
                return false;
            }
            value = args[++i];
            return true;
        }

    } // namespace

    core::Result<CommandLine> parseCommandLine(const std::vector<std::string> &args, bool allowTestFlags)
    {
        CommandLine out;
        int selectors = 0;
        int triplets = 0;

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            std::string value;

            if (arg == "--")
            {
                if (!allowTestFlags)
                {
                    return fail("unexpected trailing arguments");
                }
                out.passthrough.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            }
            if (arg == "-p" || arg == "--package")
            {
                if (!takeValue(args, i, value))
                {
                    return fail(arg + " requires value");
                }
                out.package = value;
                continue;
            }
            if (arg == "--lib")
            {
                out.selector = build::LibrarySelector{};
                ++selectors;
                continue;
            }
            if (arg == "--bin" || arg == "--example" || arg == "--bench")
            {
                if (!takeValue(args, i, value))
                {
                    return fail(arg + " requires value");
                }
                if (arg == "--bin")
                {
                    out.selector = build::BinarySelector{value};
                }
                else if (arg == "--example")
                {
                    out.selector = build::ExampleSelector{value};
                }
                else
                {
                    out.selector = build::BenchSelector{value};
                }
                ++selectors;
                continue;
            }
            if (arg == "--target-webasm")
            {
                out.flags.targetNativeWasm = true;
                ++triplets;
                continue;
            }
            if (arg == "--target-webasm-emscripten")
            {
                out.flags.targetEmscriptenWasm = true;
                ++triplets;
                continue;
            }
            if (arg == "--target-asmjs-emscripten")
            {
                ++triplets;
                continue;
            }
            if (arg == "--features")
            {
                if (!takeValue(args, i, value))
                {
                    return fail("--features requires value");
                }
                for (auto &feature : io::splitFlags(value))
                {
                    out.flags.features.push_back(std::move(feature));
                }
                continue;
            }
            if (arg == "--no-default-features")
            {
                out.flags.noDefaultFeatures = true;
                continue;
            }
            if (arg == "--all-features")
            {
                out.flags.allFeatures = true;
                continue;
            }
            if (arg == "--release")
            {
                out.flags.release = true;
                continue;
            }
            if (arg == "--use-system-emscripten")
            {
                out.flags.useSystemEmscripten = true;
                continue;
            }
            if (arg == "--message-format")
            {
                if (!takeValue(args, i, value))
                {
                    return fail("--message-format requires value");
                }
                const std::string format = lower(value);
                if (format == "human")
                {
                    out.flags.messageFormat = build::MessageFormat::Human;
                }
                else if (format == "json")
                {
                    out.flags.messageFormat = build::MessageFormat::Json;
                }
                else
                {
                    return fail("invalid --message-format: " + value + " (use human|json)");
                }
                continue;
            }
            if (arg == "-v" || arg == "--verbose")
            {
                out.flags.verbose = true;
                continue;
            }
            if (allowTestFlags && arg == "--nodejs")
            {
                out.nodejs = true;
                continue;
            }
            if (allowTestFlags && arg == "--no-run")
            {
                out.noRun = true;
                continue;
            }

            return fail("unknown option: " + arg);
        }

        if (selectors > 1)
        {
            return fail("only one of --lib, --bin, --example and --bench may be given");
        }
        if (triplets > 1)
        {
            return fail("only one of --target-asmjs-emscripten, --target-webasm-emscripten and --target-webasm may be given");
        }
        return Parsed::ok(std::move(out));
    }

    int reportError(const webpilot::Context &ctx, const core::Error &error)
    {
        // Build failures were already reported by the toolchain.
        if (error.kind == core::ErrorKind::Configuration)
        {
            ctx.error(error.message);
        }
        return kErrorExitCode;
    }

} // namespace webpilot::commands

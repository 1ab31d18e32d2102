#include "io/process.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "io/env.hpp"

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace webpilot::io {
namespace {

std::string buildDisplayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

bool validateWorkingDirectory(const std::filesystem::path &cwd, const webpilot::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

#ifdef _WIN32

bool utf8ToWide(const std::string &input, std::wstring &out) {
    out.clear();
    if (input.empty()) {
        return true;
    }

    const int size = MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
    if (size <= 0) {
        return false;
    }

    out.resize(static_cast<std::size_t>(size));
    if (MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, out.data(), size) <= 0) {
        out.clear();
        return false;
    }
    return true;
}

ProcessResult runCommandWindows(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx,
    std::string *output
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    std::wstring wideCmdLine;
    if (!utf8ToWide(result.commandLine, wideCmdLine)) {
        ctx.error("Failed to convert command line to wide string");
        return result;
    }

    std::wstring wideCwd;
    wchar_t *cwdPtr = nullptr;
    if (!cwd.empty()) {
        if (!utf8ToWide(cwd.string(), wideCwd)) {
            ctx.error("Failed to convert working directory to wide string");
            return result;
        }
        cwdPtr = wideCwd.data();
    }

    HANDLE readPipe = nullptr;
    HANDLE writePipe = nullptr;
    STARTUPINFOW si{};
    si.cb = sizeof(si);

    if (output) {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        if (!CreatePipe(&readPipe, &writePipe, &sa, 0)) {
            ctx.error("Failed to create output pipe: Error code ", static_cast<unsigned long>(GetLastError()));
            return result;
        }
        SetHandleInformation(readPipe, HANDLE_FLAG_INHERIT, 0);
        si.dwFlags |= STARTF_USESTDHANDLES;
        si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
        si.hStdOutput = writePipe;
        si.hStdError = GetStdHandle(STD_ERROR_HANDLE);
    }

    PROCESS_INFORMATION pi{};
    BOOL ok = CreateProcessW(
        nullptr,
        wideCmdLine.data(),
        nullptr,
        nullptr,
        output ? TRUE : FALSE,
        0,
        nullptr,
        cwdPtr,
        &si,
        &pi
    );

    if (writePipe) {
        CloseHandle(writePipe);
    }

    if (!ok) {
        if (readPipe) {
            CloseHandle(readPipe);
        }
        ctx.error("Failed to create process: Error code ", static_cast<unsigned long>(GetLastError()));
        return result;
    }

    result.processId = static_cast<long long>(pi.dwProcessId);

    if (output) {
        char buffer[4096];
        DWORD read = 0;
        while (ReadFile(readPipe, buffer, sizeof(buffer), &read, nullptr) && read > 0) {
            output->append(buffer, read);
        }
        CloseHandle(readPipe);
    }

    WaitForSingleObject(pi.hProcess, INFINITE);

    DWORD exitCode = 0;
    if (GetExitCodeProcess(pi.hProcess, &exitCode)) {
        result.code = static_cast<int>(exitCode);
    } else {
        ctx.error("Failed to get process exit code");
    }

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return result;
}

#else

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

ProcessResult runCommandPosix(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx,
    std::string *output
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    int fds[2] = {-1, -1};
    if (output && pipe(fds) != 0) {
        ctx.error("Failed to create output pipe: ", std::strerror(errno));
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        ctx.error("Failed to fork process: ", std::strerror(errno));
        if (output) {
            close(fds[0]);
            close(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        if (output) {
            close(fds[0]);
            dup2(fds[1], STDOUT_FILENO);
            close(fds[1]);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    result.processId = static_cast<long long>(pid);

    if (output) {
        close(fds[1]);
        char buffer[4096];
        for (;;) {
            const ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                output->append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        close(fds[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            ctx.error("Failed to wait for process: ", std::strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.code = 128 + WTERMSIG(status);
        ctx.warn("Process terminated by signal: ", WTERMSIG(status));
    } else {
        ctx.error("Process ended abnormally");
    }
    return result;
}

#endif

ProcessResult runCommandInternal(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx,
    std::string *output
) {
    if (!cwd.empty()) {
        ctx.debug("cwd: ", cwd.string());
    }
    ctx.debug(buildDisplayCommand(command, args));

    if (!validateWorkingDirectory(cwd, ctx)) {
        ProcessResult result;
        result.commandLine = buildDisplayCommand(command, args);
        return result;
    }

#ifdef _WIN32
    return runCommandWindows(command, args, cwd, ctx, output);
#else
    return runCommandPosix(command, args, cwd, ctx, output);
#endif
}

bool isExecutableFile(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

} // namespace

std::string shellQuote(const std::string &value) {
#ifdef _WIN32
    if (value.empty()) {
        return "\"\"";
    }

    bool needQuotes = false;
    for (char ch : value) {
        if (ch == ' ' || ch == '\t' || ch == '"') {
            needQuotes = true;
            break;
        }
    }
    if (!needQuotes) {
        return value;
    }

    std::string out;
    out.push_back('"');
    std::size_t backslashes = 0;
    for (char ch : value) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out.push_back('"');
            backslashes = 0;
            continue;
        }
        out.append(backslashes, '\\');
        backslashes = 0;
        out.push_back(ch);
    }
    out.append(backslashes * 2, '\\');
    out.push_back('"');
    return out;
#else
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
#endif
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx
) {
    return runCommandInternal(command, args, cwd, ctx, nullptr);
}

CapturedProcess runCommandCapture(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const webpilot::Context &ctx
) {
    CapturedProcess captured;
    captured.process = runCommandInternal(command, args, cwd, ctx, &captured.output);
    return captured;
}

std::optional<std::filesystem::path> findExecutable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }

    const std::filesystem::path direct(name);
    if (direct.has_parent_path()) {
        if (isExecutableFile(direct)) {
            return direct;
        }
        return std::nullopt;
    }

    const auto pathValue = envValue("PATH");
    if (!pathValue.has_value()) {
        return std::nullopt;
    }

    std::string entry;
    std::istringstream input(pathValue.value());
    while (std::getline(input, entry, pathListSeparator())) {
        if (entry.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(entry) / name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace webpilot::io

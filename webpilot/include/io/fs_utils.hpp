#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpilot::io {

bool ensureDir(const std::filesystem::path &path);
bool writeTextFile(const std::filesystem::path &path, const std::string &text);

std::optional<std::filesystem::path> findByExtension(
    const std::vector<std::filesystem::path> &paths,
    const std::string &extension
);

// Switches the process working directory for the lifetime of the object.
// Not safe to use from more than one thread.
class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const std::filesystem::path &dir);
    ~ScopedWorkingDirectory();

    ScopedWorkingDirectory(const ScopedWorkingDirectory &) = delete;
    ScopedWorkingDirectory &operator=(const ScopedWorkingDirectory &) = delete;

    const std::filesystem::path &previous() const { return previous_; }

private:
    std::filesystem::path previous_;
};

} // namespace webpilot::io

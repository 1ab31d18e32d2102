#include "io/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace webpilot::io
{

    namespace
    {

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // namespace

    bool ensureDir(const fs::path &path)
    {
        std::error_code ec;
        if (fs::exists(path, ec))
        {
            return fs::is_directory(path, ec);
        }
        return fs::create_directories(path, ec) && !ec;
    }

    bool writeTextFile(const fs::path &path, const std::string &text)
    {
        if (path.has_parent_path() && !ensureDir(path.parent_path()))
        {
            return false;
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            return false;
        }
        out << text;
        return static_cast<bool>(out);
    }

    std::optional<fs::path> findByExtension(const std::vector<fs::path> &paths, const std::string &extension)
    {
        const std::string wanted = lower(extension);
        for (const auto &path : paths)
        {
            if (lower(path.extension().string()) == wanted)
            {
                return path;
            }
        }
        return std::nullopt;
    }

    ScopedWorkingDirectory::ScopedWorkingDirectory(const fs::path &dir)
        : previous_(fs::current_path())
    {
        fs::current_path(dir);
    }

    ScopedWorkingDirectory::~ScopedWorkingDirectory()
    {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

} // namespace webpilot::io

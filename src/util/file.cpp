#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <fstream>
#include <filesystem>
#include <system_error>

#include "util/file.hpp"

// Checks if a file exists at the given path
bool fileExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0);
}

bool isDirectory(const std::string &path)
{
    struct stat buf;
    return stat(path.c_str(), &buf) == 0 && S_ISDIR(buf.st_mode);
}

// Size of a regular file, or nothing if it does not exist
std::optional<std::uint64_t> fileSize(const std::string &path)
{
    struct stat buf{};
    if (stat(path.c_str(), &buf) != 0 || !S_ISREG(buf.st_mode))
    {
        return std::nullopt;
    }

    return static_cast<std::uint64_t>(buf.st_size);
}

// Generates a unique filename based on the original path
std::string getUniqueFilename(const std::string &originalPath,
                              const std::function<bool(const std::string &)> &isTaken)
{
    // If the name is free, return the original filename
    if (!isTaken(originalPath))
        return originalPath;

    std::string base = originalPath;
    std::string extension;
    const std::size_t dotPos = originalPath.find_last_of('.');
    const std::size_t slashPos = originalPath.find_last_of('/');

    // Only treat the dot as an extension separator if it belongs to the file name
    if (dotPos != std::string::npos && (slashPos == std::string::npos || dotPos > slashPos + 1))
    {
        base = originalPath.substr(0, dotPos);
        extension = originalPath.substr(dotPos);
    }

    int counter = 1;
    while (true)
    {
        // Generate a candidate filename with __<counter> appended to the base name
        std::string candidate = base + "__" + std::to_string(counter) + extension;

        if (!isTaken(candidate))
            return candidate;

        ++counter;
    }
}

std::string normalisePath(const std::string &path)
{
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        absolute = path;
    }

    return absolute.lexically_normal().string();
}

bool isWritableDestination(const std::string &path)
{
    if (path.empty() || path.back() == '/')
        return false;

    if (isDirectory(path))
        return false;

    if (fileExists(path))
        return access(path.c_str(), W_OK) == 0;

    std::filesystem::path parent = std::filesystem::path(normalisePath(path)).parent_path();
    return isDirectory(parent.string()) && access(parent.c_str(), W_OK | X_OK) == 0;
}

std::string joinPath(const std::string &directory, const std::string &filename)
{
    if (directory.empty())
        return filename;

    if (directory.back() == '/')
        return directory + filename;

    return directory + "/" + filename;
}

std::string getStateDirectory()
{
    std::string stateDirectory;

    const char *overridden = std::getenv(RDM_STATE_DIR_ENV);
    if (overridden && *overridden)
    {
        stateDirectory = overridden;
    }
    else
    {
        const char *home = std::getenv("HOME");
        if (!home)
        {
            // Fallback to current directory if HOME is not set
            return ".";
        }
        stateDirectory = std::string(home) + "/." + RDM_STATE_DIRECTORY;
    }

    std::error_code ec;
    std::filesystem::create_directories(stateDirectory, ec);
    return stateDirectory;
}

bool writeFileAtomically(const std::string &path, const std::string &content)
{
    const std::string temporaryPath = path + ".tmp";

    {
        std::ofstream out(temporaryPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            return false;
        }

        out << content;
        out.flush();
        if (!out)
        {
            out.close();
            std::remove(temporaryPath.c_str());
            return false;
        }
    }

    if (std::rename(temporaryPath.c_str(), path.c_str()) != 0)
    {
        std::remove(temporaryPath.c_str());
        return false;
    }

    return true;
}

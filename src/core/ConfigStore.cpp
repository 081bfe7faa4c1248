#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <system_error>

#include "core/ConfigStore.hpp"
#include "core/ManagerError.hpp"
#include "util/args.hpp"
#include "util/file.hpp"
#include "util/log.hpp"
#include "util/version.hpp"

namespace
{
    // Applies one "key value" pair read from the config file; unknown keys are ignored
    bool applySetting(AppConfig &config, const std::string &key, const std::string &value)
    {
        if (key == "maxConcurrentDownloads" || key == "chunkSize" ||
            key == "requestTimeoutSecs" || key == "retryCount")
        {
            std::optional<std::uint64_t> number = parseUnsigned(value);
            if (!number)
                return false;

            if (key == "maxConcurrentDownloads")
                config.maxConcurrentDownloads = static_cast<size_t>(*number);
            else if (key == "chunkSize")
                config.chunkSize = static_cast<size_t>(*number);
            else if (key == "requestTimeoutSecs")
                config.requestTimeoutSecs = static_cast<long>(*number);
            else
                config.retryCount = static_cast<int>(*number);
        }
        else if (key == "autoCheckUpdates")
        {
            std::optional<bool> flag = parseFlag(value);
            if (!flag)
                return false;
            config.autoCheckUpdates = *flag;
        }
        else if (key == "defaultDirectory")
        {
            config.defaultDirectory = value;
        }
        else if (key == "userAgent")
        {
            config.userAgent = value;
        }
        else if (key == "updateManifestUrl")
        {
            config.updateManifestUrl = value;
        }

        return true;
    }
}

AppConfig AppConfig::defaults()
{
    AppConfig config;

    const char *home = std::getenv("HOME");
    config.defaultDirectory = home ? joinPath(home, "Downloads") : "Downloads";
    config.userAgent = std::string("rdm/") + RDM_VERSION;
    return config;
}

bool operator==(const AppConfig &a, const AppConfig &b)
{
    return a.maxConcurrentDownloads == b.maxConcurrentDownloads &&
           a.defaultDirectory == b.defaultDirectory &&
           a.autoCheckUpdates == b.autoCheckUpdates &&
           a.chunkSize == b.chunkSize &&
           a.requestTimeoutSecs == b.requestTimeoutSecs &&
           a.retryCount == b.retryCount &&
           a.userAgent == b.userAgent &&
           a.updateManifestUrl == b.updateManifestUrl;
}

bool operator!=(const AppConfig &a, const AppConfig &b)
{
    return !(a == b);
}

ConfigStore::ConfigStore(std::string filePath)
    : _filePath(std::move(filePath)),
      _config(AppConfig::defaults())
{
    load();
}

AppConfig ConfigStore::get() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _config;
}

void ConfigStore::validate(const AppConfig &config)
{
    if (config.maxConcurrentDownloads < 1)
        throw ManagerError(ErrorKind::INVALID_CONFIG, "maxConcurrentDownloads must be at least 1");

    if (config.chunkSize == 0)
        throw ManagerError(ErrorKind::INVALID_CONFIG, "chunkSize must be greater than 0");

    if (config.requestTimeoutSecs <= 0)
        throw ManagerError(ErrorKind::INVALID_CONFIG, "requestTimeoutSecs must be greater than 0");

    if (config.retryCount < 0)
        throw ManagerError(ErrorKind::INVALID_CONFIG, "retryCount must not be negative");

    if (config.defaultDirectory.empty())
        throw ManagerError(ErrorKind::INVALID_CONFIG, "defaultDirectory must not be empty");

    if (!isDirectory(config.defaultDirectory))
    {
        std::error_code ec;
        std::filesystem::create_directories(config.defaultDirectory, ec);
        if (ec || !isDirectory(config.defaultDirectory))
        {
            throw ManagerError(ErrorKind::INVALID_CONFIG,
                               "defaultDirectory cannot be created: " + config.defaultDirectory);
        }
    }
}

void ConfigStore::update(const AppConfig &newConfig)
{
    validate(newConfig);

    std::lock_guard<std::mutex> lock(_mutex);
    if (!save(newConfig))
    {
        logging::error("Failed to save config to {}; the change applies to this session only", _filePath);
    }
    _config = newConfig;

    logging::info("Config updated: maxConcurrentDownloads={} defaultDirectory={} autoCheckUpdates={}",
                 newConfig.maxConcurrentDownloads, newConfig.defaultDirectory, newConfig.autoCheckUpdates);
}

//------------------------------------------------------------------------------
// Loading and saving settings from and to disk
//------------------------------------------------------------------------------

void ConfigStore::load()
{
    if (_filePath.empty())
        return;

    std::ifstream inFile(_filePath);
    if (!inFile.is_open())
    {
        return; // No file => defaults
    }

    AppConfig loaded = AppConfig::defaults();

    std::string line;
    while (std::getline(inFile, line))
    {
        if (line.empty())
            continue;

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> std::quoted(value)) || !applySetting(loaded, key, value))
        {
            logging::warn("Ignoring malformed config line in {}: {}", _filePath, line);
        }
    }

    // A hand-edited file may hold values update() would reject; keep the defaults then
    if (loaded.maxConcurrentDownloads < 1 || loaded.chunkSize == 0 || loaded.requestTimeoutSecs <= 0)
    {
        logging::warn("Config file {} holds invalid values; using defaults", _filePath);
        return;
    }

    _config = loaded;
}

bool ConfigStore::save(const AppConfig &config) const
{
    if (_filePath.empty())
        return true;

    std::ostringstream out;
    out << "maxConcurrentDownloads " << std::quoted(std::to_string(config.maxConcurrentDownloads)) << "\n"
        << "defaultDirectory " << std::quoted(config.defaultDirectory) << "\n"
        << "autoCheckUpdates " << std::quoted(config.autoCheckUpdates ? "on" : "off") << "\n"
        << "chunkSize " << std::quoted(std::to_string(config.chunkSize)) << "\n"
        << "requestTimeoutSecs " << std::quoted(std::to_string(config.requestTimeoutSecs)) << "\n"
        << "retryCount " << std::quoted(std::to_string(config.retryCount)) << "\n"
        << "userAgent " << std::quoted(config.userAgent) << "\n"
        << "updateManifestUrl " << std::quoted(config.updateManifestUrl) << "\n";

    return writeFileAtomically(_filePath, out.str());
}

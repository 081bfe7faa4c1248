#ifndef CONFIGSTORE_HPP
#define CONFIGSTORE_HPP

#include <string>
#include <mutex>
#include <cstddef>

static constexpr const char RDM_CONFIG_FILENAME[] = "config";

struct AppConfig
{
    size_t maxConcurrentDownloads{3};
    std::string defaultDirectory;
    bool autoCheckUpdates{true};
    size_t chunkSize{64 * 1024};
    long requestTimeoutSecs{30};
    int retryCount{2};
    std::string userAgent;
    std::string updateManifestUrl;

    // Defaults with the directory under $HOME and the user agent carrying the build version
    static AppConfig defaults();
};

bool operator==(const AppConfig &a, const AppConfig &b);
bool operator!=(const AppConfig &a, const AppConfig &b);

// Persisted application settings. Readers always see a complete config: update()
// validates first and swaps the whole value.
class ConfigStore
{
public:
    // With a non-empty filePath the store loads from and saves to that file
    explicit ConfigStore(std::string filePath = "");

    ConfigStore(const ConfigStore &) = delete;
    ConfigStore &operator=(const ConfigStore &) = delete;

    AppConfig get() const;

    // Throws ManagerError(INVALID_CONFIG) and keeps the stored value if newConfig is invalid
    void update(const AppConfig &newConfig);

    // Throws ManagerError(INVALID_CONFIG) describing the first invalid field
    static void validate(const AppConfig &config);

private:
    std::string _filePath;

    mutable std::mutex _mutex;
    AppConfig _config;

    void load();
    bool save(const AppConfig &config) const;
};

#endif

#ifndef DOWNLOADAPPLICATION_HPP
#define DOWNLOADAPPLICATION_HPP

#include <string>

#include "util/log.hpp"

struct ApplicationOptions
{
    std::string stateDirectory; // empty => getStateDirectory()
    LogLevel logLevel{LogLevel::INFO};
};

// Wires the download manager to the terminal front end and runs it until the user quits
class DownloadApplication
{
public:
    explicit DownloadApplication(ApplicationOptions options);
    ~DownloadApplication();

    int run();

private:
    ApplicationOptions _options;
};

#endif

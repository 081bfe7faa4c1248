#include <iostream>
#include <exception>
#include <utility>
#include <string>

#include "core/DownloadApplication.hpp"
#include "util/version.hpp"

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [--state-dir DIR] [--log-level debug|info|warn|error|off] [--version]\n";
    }

    bool parseLogLevel(const std::string &text, LogLevel &level)
    {
        if (text == "debug")
            level = LogLevel::DEBUG;
        else if (text == "info")
            level = LogLevel::INFO;
        else if (text == "warn")
            level = LogLevel::WARN;
        else if (text == "error")
            level = LogLevel::ERROR;
        else if (text == "off")
            level = LogLevel::OFF;
        else
            return false;

        return true;
    }
}

int main(int argc, char *argv[])
{
    ApplicationOptions options;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--version")
        {
            std::cout << "rdm " << RDM_VERSION << "\n";
            return 0;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--state-dir" && i + 1 < argc)
        {
            options.stateDirectory = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            if (!parseLogLevel(argv[++i], options.logLevel))
            {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 2;
            }
        }
        else
        {
            printUsage(argv[0]);
            return 2;
        }
    }

    try
    {
        DownloadApplication app(std::move(options));
        return app.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "rdm: " << e.what() << "\n";
        return 1;
    }
}

#include <curses.h>
#include <string>
#include <vector>

#include "ui/SettingsScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

namespace
{
    std::uint64_t requireNumber(const std::string &key, const std::string &value)
    {
        std::optional<std::uint64_t> number = parseUnsigned(value);
        if (!number)
        {
            throw ManagerError(ErrorKind::INVALID_CONFIG, key + " expects a non-negative number, got '" + value + "'");
        }
        return *number;
    }
}

SettingsScreen::SettingsScreen(DownloadManager &manager, UI &ui)
    : Screen(manager, ui),
      _commandTable{
          {{"set"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseSetCommand(command);
           }},
          {{"check"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               checkForUpdate();
           }},
          {{"install"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               installUpdate();
           }},
          {{"back", "b", ""},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::ACTIVE);
           }}}
{
}

void SettingsScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "set <key> <value> | Change a setting");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "check             | Check for a newer version");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "install           | Download and launch the newer version");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "back              | Return to downloads");
}

void SettingsScreen::drawScreen(int &currentRow, WINDOW *win)
{
    AppConfig config = _manager.getConfig();

    mvwprintw(win, currentRow, LEFT_PADDING, "Settings:");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "maxConcurrentDownloads  %zu", config.maxConcurrentDownloads);
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "defaultDirectory        %s", config.defaultDirectory.c_str());
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "autoCheckUpdates        %s", config.autoCheckUpdates ? "on" : "off");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "chunkSize               %s",
              formatBytes(static_cast<double>(config.chunkSize)).c_str());
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "requestTimeoutSecs      %ld", config.requestTimeoutSecs);
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "retryCount              %d", config.retryCount);
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "userAgent               %s", config.userAgent.c_str());
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "updateManifestUrl       %s",
              config.updateManifestUrl.empty() ? "(not set)" : config.updateManifestUrl.c_str());

    mvwprintw(win, currentRow += 2, LEFT_PADDING, "Version %s", RDM_VERSION);
    if (_lastCheck)
    {
        if (_lastCheck->available)
        {
            mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "Update available: %s%s%s",
                      _lastCheck->latestVersion.c_str(),
                      _lastCheck->mandatory ? " (mandatory)" : "",
                      _lastCheck->releaseDate.empty() ? "" : (", released " + _lastCheck->releaseDate).c_str());
            if (!_lastCheck->notes.empty())
            {
                mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "%s", _lastCheck->notes.c_str());
            }
        }
        else
        {
            mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "Up to date (latest is %s)", _lastCheck->latestVersion.c_str());
        }
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

void SettingsScreen::parseSetCommand(const std::string &command)
{
    auto args = extractArguments(command, 2);
    if (args.size() < 2)
    {
        _ui.setStatus("Usage: set <key> <value>");
        return;
    }

    const std::string &key = args[0];
    const std::string &value = args[1];
    AppConfig config = _manager.getConfig();

    if (key == "maxConcurrentDownloads")
        config.maxConcurrentDownloads = static_cast<size_t>(requireNumber(key, value));
    else if (key == "defaultDirectory")
        config.defaultDirectory = value;
    else if (key == "autoCheckUpdates")
    {
        std::optional<bool> flag = parseFlag(value);
        if (!flag)
            throw ManagerError(ErrorKind::INVALID_CONFIG, key + " expects on or off");
        config.autoCheckUpdates = *flag;
    }
    else if (key == "chunkSize")
        config.chunkSize = static_cast<size_t>(requireNumber(key, value));
    else if (key == "requestTimeoutSecs")
        config.requestTimeoutSecs = static_cast<long>(requireNumber(key, value));
    else if (key == "retryCount")
        config.retryCount = static_cast<int>(requireNumber(key, value));
    else if (key == "userAgent")
        config.userAgent = value;
    else if (key == "updateManifestUrl")
        config.updateManifestUrl = value;
    else
        throw ManagerError(ErrorKind::INVALID_CONFIG, "Unknown setting: " + key);

    _manager.updateConfig(config);
    _ui.setStatus("Saved " + key);
}

void SettingsScreen::checkForUpdate()
{
    _lastCheck = _manager.checkUpdates();
    _ui.setStatus(_lastCheck->available ? "Version " + _lastCheck->latestVersion + " is available"
                                        : std::string("No update available"));
}

void SettingsScreen::installUpdate()
{
    _ui.setStatus("Downloading update...");
    _manager.downloadAndInstallUpdate();
}

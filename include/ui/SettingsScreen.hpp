#ifndef SETTINGS_SCREEN_HPP
#define SETTINGS_SCREEN_HPP

#include <optional>

#include "ui/Screen.hpp"
#include "ui/UI.hpp"

class SettingsScreen : public Screen
{
public:
    explicit SettingsScreen(DownloadManager &manager, UI &ui);

    std::vector<CommandEntry> getCommandTable() const override { return _commandTable; }
    void drawAvailableCommands(int &currentRow, WINDOW *window) override;
    void drawScreen(int &currentRow, WINDOW *window) override;

private:
    const std::vector<CommandEntry> _commandTable;
    std::optional<UpdateInfo> _lastCheck;

    void parseSetCommand(const std::string &command);
    void checkForUpdate();
    void installUpdate();
};

#endif

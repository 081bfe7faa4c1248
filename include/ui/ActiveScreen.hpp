#ifndef ACTIVE_SCREEN_HPP
#define ACTIVE_SCREEN_HPP

#include <unordered_map>
#include <chrono>

#include "ui/Screen.hpp"
#include "ui/UI.hpp"

class ActiveScreen : public Screen
{
public:
    explicit ActiveScreen(DownloadManager &manager, UI &ui);

    std::vector<CommandEntry> getCommandTable() const override { return _commandTable; }
    void drawAvailableCommands(int &currentRow, WINDOW *window) override;
    void drawScreen(int &currentRow, WINDOW *window) override;

private:
    // Last observed byte count, used to estimate the current speed of each task
    struct SpeedSample
    {
        std::uint64_t bytes{0};
        std::chrono::steady_clock::time_point time;
        double bytesPerSecond{0.0};
    };

    const std::vector<CommandEntry> _commandTable;
    std::unordered_map<std::string, SpeedSample> _samples;

    std::vector<std::string> getTaskIds() const;

    void parseDownloadCommand(const std::string &command);
    void parsePauseCommand(const std::string &command);
    void parseResumeCommand(const std::string &command);
    void parseCancelCommand(const std::string &command);
    void parseRetryCommand(const std::string &command);
    void parseRemoveCommand(const std::string &command);
    double updateSpeed(const DownloadTask &task);
    void drawDownloadProgress(int &currentRow,
                              WINDOW *win,
                              size_t index,
                              const DownloadTask &task);
};

#endif

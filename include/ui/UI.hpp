#ifndef UI_HPP
#define UI_HPP

#include <curses.h>
#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <mutex>

#include "ui/Screen.hpp"
#include "core/DownloadManager.hpp"

static constexpr int LEFT_PADDING = 2;
static constexpr int BAR_WIDTH = 32;

// Curses front end: a header listing the current screen's commands, a scrollable body
// and a command line with a status row and a task summary.
class UI
{
public:
    explicit UI(DownloadManager &manager);
    ~UI();

    UI(const UI &) = delete;
    UI &operator=(const UI &) = delete;

    void run();

    // Ends the loop at its next iteration; safe to call from any thread
    void stop();

    void changeScreen(ScreenType newScreen);

    // Shows a message above the prompt until it expires or is replaced; safe from any thread
    void setStatus(const std::string &message);

private:
    struct StatusLine
    {
        std::string text;
        std::chrono::steady_clock::time_point shownAt;
    };

    DownloadManager &_manager;
    std::atomic<bool> _isRunning{true};
    std::atomic<bool> _tasksChanged{true}; // set by the registry listener, cleared on redraw
    size_t _listenerToken{0};

    std::string _commandBuffer;
    std::chrono::steady_clock::time_point _lastFullUpdateTime;
    std::unique_ptr<Screen> _screen;

    mutable std::mutex _statusMutex;
    StatusLine _status;

    WINDOW *_headerWin = nullptr;
    WINDOW *_cmdLineWin = nullptr;
    WINDOW *_bodyPad = nullptr;

    int _cmdLineHeight = 0;
    int _headerHeight = 0;
    int _padHeight = 0;
    int _padWidth = 0;
    int _scrollOffset = 0;
    int _maxContentHeight = 0;

    void initialiseCurses();
    void cleanupCurses();
    void createWindows();
    void destroyWindows();

    void processInput();
    void handleKeyPress(int ch);
    void handleCommand(const std::string &command);
    void updateScreen(bool immediate = false);

    void drawFullScreen();
    void drawHeader();
    void drawBody();
    void drawCommandLine();
    void scrollBy(int lines);

    std::string getStatus() const;
    std::string getTaskSummary() const;
};

#endif

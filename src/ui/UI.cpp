#include <curses.h>
#include <chrono>
#include <thread>
#include <algorithm>
#include <cctype>

#include "ui/UI.hpp"
#include "ui/ActiveScreen.hpp"
#include "ui/HistoryScreen.hpp"
#include "ui/SettingsScreen.hpp"
#include "util/log.hpp"

namespace
{
    constexpr std::chrono::milliseconds FRAME_INTERVAL{10};
    constexpr std::chrono::milliseconds FULL_REDRAW_INTERVAL{500};
    constexpr std::chrono::seconds STATUS_LIFETIME{8};

    constexpr int BODY_PAD_ROWS = 1000;
    constexpr int PAGE_LINES = 5;
}

UI::UI(DownloadManager &manager)
    : _manager(manager),
      _lastFullUpdateTime(std::chrono::steady_clock::now()),
      _screen(std::make_unique<ActiveScreen>(_manager, *this))
{
    // Listeners must not call back into the manager; only flag the change for the UI thread
    _listenerToken = _manager.subscribe([this](const TaskUpdate &update)
                                        {
                                            if (update.kind != TaskUpdateKind::PROGRESS)
                                                _tasksChanged = true;
                                        });
}

UI::~UI()
{
    _manager.unsubscribe(_listenerToken);
}

void UI::run()
{
    initialiseCurses();
    createWindows();
    drawFullScreen();

    while (_isRunning)
    {
        processInput();
        updateScreen(_tasksChanged.exchange(false));
        std::this_thread::sleep_for(FRAME_INTERVAL);
    }

    destroyWindows();
    cleanupCurses();
}

void UI::stop()
{
    _isRunning = false;
}

void UI::changeScreen(ScreenType newScreen)
{
    switch (newScreen)
    {
    case ScreenType::ACTIVE:
        _screen = std::make_unique<ActiveScreen>(_manager, *this);
        break;
    case ScreenType::HISTORY:
        _screen = std::make_unique<HistoryScreen>(_manager, *this);
        break;
    case ScreenType::SETTINGS:
        _screen = std::make_unique<SettingsScreen>(_manager, *this);
        break;
    }

    _scrollOffset = 0;
    drawFullScreen();
}

void UI::setStatus(const std::string &message)
{
    std::lock_guard<std::mutex> lock(_statusMutex);
    _status.text = message;
    _status.shownAt = std::chrono::steady_clock::now();
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

void UI::initialiseCurses()
{
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // getch() returns ERR instead of blocking
}

void UI::cleanupCurses()
{
    endwin();
}

// Header and command line are fixed windows; the body is a pad scrolled underneath them
void UI::createWindows()
{
    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    _headerHeight = 1; // grows once the header has been drawn
    _cmdLineHeight = 3; // status, prompt, summary
    _headerWin = newwin(_headerHeight, maxX, 0, 0);
    _cmdLineWin = newwin(_cmdLineHeight, maxX, maxY - _cmdLineHeight, 0);

    _padWidth = maxX;
    _padHeight = BODY_PAD_ROWS;
    _bodyPad = newpad(_padHeight, _padWidth);

    scrollok(_headerWin, FALSE);
    scrollok(_cmdLineWin, FALSE);
    scrollok(_bodyPad, FALSE);
}

void UI::destroyWindows()
{
    for (WINDOW **window : {&_headerWin, &_cmdLineWin, &_bodyPad})
    {
        if (*window)
        {
            delwin(*window);
            *window = nullptr;
        }
    }
}

void UI::processInput()
{
    for (int ch = getch(); ch != ERR; ch = getch())
    {
        handleKeyPress(ch);
    }
}

void UI::handleKeyPress(int ch)
{
    switch (ch)
    {
    case '\n':
    case '\r':
    {
        // The buffer is cleared first: the command may replace the screen
        std::string command = _commandBuffer;
        _commandBuffer.clear();
        handleCommand(command);
        break;
    }

    case KEY_BACKSPACE:
    case 127: // DEL
    case 8:   // ^H
        if (!_commandBuffer.empty())
            _commandBuffer.pop_back();
        break;

    case 21: // ^U clears the line
        _commandBuffer.clear();
        break;

    case KEY_UP:
        scrollBy(-1);
        break;
    case KEY_DOWN:
        scrollBy(1);
        break;
    case KEY_PPAGE:
        scrollBy(-PAGE_LINES);
        break;
    case KEY_NPAGE:
        scrollBy(PAGE_LINES);
        break;

    case KEY_RESIZE:
        destroyWindows();
        createWindows();
        _scrollOffset = 0;
        break;

    default:
        if (ch >= 0 && ch < 256 && std::isprint(ch))
            _commandBuffer.push_back(static_cast<char>(ch));
        break;
    }

    updateScreen(true);
}

// Runs the first command whose alias matches. A failing command reports its error
// on the status line instead of leaving the UI.
void UI::handleCommand(const std::string &userInput)
{
    const std::string firstWord = userInput.substr(0, userInput.find(' '));

    for (const auto &entry : _screen->getCommandTable())
    {
        bool matched = std::any_of(entry.commands.begin(), entry.commands.end(),
                                   [&](const std::string &alias)
                                   {
                                       return entry.matchType == MatchType::EXACT ? userInput == alias
                                                                                  : firstWord == alias;
                                   });
        if (!matched)
            continue;

        setStatus("");
        try
        {
            entry.action(userInput);
        }
        catch (const ManagerError &e)
        {
            logging::info("Command '{}' failed: {}", userInput, e.what());
            setStatus(e.what());
        }
        return;
    }

    if (!userInput.empty())
    {
        setStatus("Unknown command: " + firstWord);
    }
}

// Redraws everything when asked to or every FULL_REDRAW_INTERVAL (progress and speed);
// otherwise only the command line is refreshed
void UI::updateScreen(bool immediate)
{
    auto now = std::chrono::steady_clock::now();
    if (immediate || now - _lastFullUpdateTime >= FULL_REDRAW_INTERVAL)
    {
        drawFullScreen();
        _lastFullUpdateTime = now;
    }
    else
    {
        drawCommandLine();
    }
}

void UI::drawFullScreen()
{
    werase(_headerWin);
    werase(_cmdLineWin);
    werase(_bodyPad);

    drawHeader(); // sets _headerHeight

    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    mvwin(_headerWin, 0, 0);
    wresize(_headerWin, _headerHeight, maxX);
    wrefresh(_headerWin);

    _maxContentHeight = std::max(maxY - _headerHeight - _cmdLineHeight - 1, 1);

    mvwin(_cmdLineWin, maxY - _cmdLineHeight, 0);
    wresize(_cmdLineWin, _cmdLineHeight, maxX);

    drawBody();
    _scrollOffset = std::min(_scrollOffset, std::max(_padHeight - _maxContentHeight, 0));

    prefresh(_bodyPad,
             _scrollOffset, 0,                            // first pad row and column shown
             _headerHeight, 0,                            // top left corner on screen
             _headerHeight + _maxContentHeight, _padWidth - 1); // bottom right corner on screen

    drawCommandLine();
}

void UI::drawHeader()
{
    werase(_headerWin);

    int currentRow = 0;
    mvwprintw(_headerWin, ++currentRow, LEFT_PADDING, "RDM %s - Resumable Download Manager", RDM_VERSION);
    mvwprintw(_headerWin, currentRow += 2, LEFT_PADDING, "Commands:");
    _screen->drawAvailableCommands(currentRow, _headerWin);

    wrefresh(_headerWin);

    _headerHeight = currentRow + 2;
}

void UI::drawBody()
{
    int currentRow = 0;
    _screen->drawScreen(currentRow, _bodyPad);
    _padHeight = std::max(currentRow + 1, _maxContentHeight);
}

// Row 0: status message, row 1: prompt with the cursor, row 2: task summary
void UI::drawCommandLine()
{
    werase(_cmdLineWin);

    std::string status = getStatus();
    if (!status.empty())
    {
        mvwprintw(_cmdLineWin, 0, LEFT_PADDING, "%s", status.c_str());
    }

    mvwprintw(_cmdLineWin, 2, LEFT_PADDING, "%s", getTaskSummary().c_str());

    mvwprintw(_cmdLineWin, 1, LEFT_PADDING, "> %s", _commandBuffer.c_str());
    wmove(_cmdLineWin, 1, LEFT_PADDING + 2 + static_cast<int>(_commandBuffer.size()));

    wrefresh(_cmdLineWin);
}

void UI::scrollBy(int lines)
{
    int maxOffset = std::max(_padHeight - _maxContentHeight, 0);
    _scrollOffset = std::clamp(_scrollOffset + lines, 0, maxOffset);
}

std::string UI::getStatus() const
{
    std::lock_guard<std::mutex> lock(_statusMutex);
    if (std::chrono::steady_clock::now() - _status.shownAt > STATUS_LIFETIME)
        return "";

    return _status.text;
}

// e.g. "2 downloading, 1 queued, 1 paused, 1 failed"
std::string UI::getTaskSummary() const
{
    size_t downloading = 0, queued = 0, paused = 0, failed = 0;
    for (const auto &task : _manager.getTasks())
    {
        switch (task.getState())
        {
        case TaskState::DOWNLOADING:
            ++downloading;
            break;
        case TaskState::QUEUED:
            ++queued;
            break;
        case TaskState::PAUSED:
            ++paused;
            break;
        case TaskState::FAILED:
            ++failed;
            break;
        default:
            break;
        }
    }

    std::string summary = fmt::format("{} downloading, {} queued, {} paused", downloading, queued, paused);
    if (failed > 0)
    {
        summary += fmt::format(", {} failed", failed);
    }
    return summary;
}

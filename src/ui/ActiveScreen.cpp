#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

#include "ui/ActiveScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

ActiveScreen::ActiveScreen(DownloadManager &manager, UI &ui)
    : Screen(manager, ui),
      _commandTable{
          {{"exit", "quit", "q"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.stop();
           }},
          {{"download", "d"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseDownloadCommand(command);
           }},
          {{"pause", "p"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parsePauseCommand(command);
           }},
          {{"resume", "r"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseResumeCommand(command);
           }},
          {{"cancel", "c"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseCancelCommand(command);
           }},
          {{"retry"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseRetryCommand(command);
           }},
          {{"remove", "rm"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseRemoveCommand(command);
           }},
          {{"history", "h"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::HISTORY);
           }},
          {{"settings", "s"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::SETTINGS);
           }}}
{
}

void ActiveScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "download <URL> [file|dir] | Start a new download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "pause [n|id]              | Pause a download (all if omitted)");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "resume [n|id]             | Resume a paused download (all if omitted)");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "cancel <n|id>             | Cancel a download and delete its file");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "retry <n|id>              | Retry a failed download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "remove <n|id>             | Remove a queued, finished or failed task");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "history                   | Show past downloads (%zu)",
              _manager.getHistory().size());
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "settings                  | Configuration and updates");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "exit                      | Quit the program");
}

void ActiveScreen::drawScreen(int &currentRow, WINDOW *win)
{
    std::vector<DownloadTask> tasks = _manager.getTasks();

    auto count = [&tasks](TaskState state)
    {
        return std::count_if(tasks.begin(), tasks.end(), [state](const DownloadTask &task)
                             { return task.getState() == state; });
    };

    if (tasks.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Downloads: None");
        return;
    }

    mvwprintw(win, currentRow, LEFT_PADDING, "Downloads: %ld active, %ld paused, %ld queued, %ld failed, %ld completed",
              static_cast<long>(count(TaskState::DOWNLOADING)),
              static_cast<long>(count(TaskState::PAUSED)),
              static_cast<long>(count(TaskState::QUEUED)),
              static_cast<long>(count(TaskState::FAILED)),
              static_cast<long>(count(TaskState::COMPLETED)));

    for (size_t i = 0; i < tasks.size(); ++i)
    {
        currentRow += 2;
        drawDownloadProgress(currentRow, win, i + 1, tasks[i]);
    }

    // Forget samples of tasks that are gone
    for (auto it = _samples.begin(); it != _samples.end();)
    {
        bool live = std::any_of(tasks.begin(), tasks.end(), [&it](const DownloadTask &task)
                                { return task.getId() == it->first; });
        it = live ? std::next(it) : _samples.erase(it);
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

std::vector<std::string> ActiveScreen::getTaskIds() const
{
    std::vector<std::string> ids;
    for (const auto &task : _manager.getTasks())
    {
        ids.push_back(task.getId());
    }
    return ids;
}

void ActiveScreen::parseDownloadCommand(const std::string &command)
{
    auto args = extractArguments(command, 2);
    if (args.empty())
    {
        _ui.setStatus("Usage: download <URL> [file|dir]");
        return;
    }

    // No destination provided => default directory
    std::string id = _manager.addTask(args[0], args.size() == 1 ? "" : args[1]);
    _ui.setStatus("Added " + id + " -> " + _manager.getTask(id).getDestination());
}

void ActiveScreen::parsePauseCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        // No index provided, pause all
        _ui.setStatus("Paused " + std::to_string(_manager.pauseAll()) + " download(s)");
        return;
    }

    _manager.pauseTask(resolveId(args[0], getTaskIds()));
}

void ActiveScreen::parseResumeCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        // No index provided, resume all
        _ui.setStatus("Resumed " + std::to_string(_manager.resumeAll()) + " download(s)");
        return;
    }

    _manager.resumeTask(resolveId(args[0], getTaskIds()));
}

void ActiveScreen::parseCancelCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: cancel <n|id>");
        return;
    }

    _manager.cancelTask(resolveId(args[0], getTaskIds()));
}

void ActiveScreen::parseRetryCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: retry <n|id>");
        return;
    }

    _manager.retryTask(resolveId(args[0], getTaskIds()));
}

void ActiveScreen::parseRemoveCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: remove <n|id>");
        return;
    }

    _manager.removeTask(resolveId(args[0], getTaskIds()));
}

// Smoothed transfer rate since the previous redraw
double ActiveScreen::updateSpeed(const DownloadTask &task)
{
    auto now = std::chrono::steady_clock::now();
    auto it = _samples.find(task.getId());
    if (it == _samples.end() || task.getBytesReceived() < it->second.bytes)
    {
        _samples[task.getId()] = SpeedSample{task.getBytesReceived(), now, 0.0};
        return 0.0;
    }

    SpeedSample &sample = it->second;
    double elapsed = std::chrono::duration<double>(now - sample.time).count();
    if (elapsed >= 0.5)
    {
        double instant = static_cast<double>(task.getBytesReceived() - sample.bytes) / elapsed;
        sample.bytesPerSecond = sample.bytesPerSecond * 0.5 + instant * 0.5;
        sample.bytes = task.getBytesReceived();
        sample.time = now;
    }

    return sample.bytesPerSecond;
}

void ActiveScreen::drawDownloadProgress(int &currentRow,
                                        WINDOW *win,
                                        size_t index,
                                        const DownloadTask &task)
{
    // <index>) [<state>] <url> -> <destination>
    mvwprintw(win, currentRow++, LEFT_PADDING + 1,
              "%zu) [%s] %s -> %s",
              index,
              toString(task.getState()),
              task.getUrl().c_str(),
              task.getDestination().c_str());

    if (task.getState() == TaskState::FAILED && task.getError())
    {
        // E-<curl code>-<http code>: <message>
        const TaskError &error = *task.getError();
        mvwprintw(win, currentRow, LEFT_PADDING + 3, "E-%02d-%03ld: %s",
                  static_cast<int>(error.curlCode),
                  error.httpStatus,
                  error.message.c_str());
        return;
    }

    bool isActive = task.getState() == TaskState::DOWNLOADING;

    // Prepare progress bar
    double progress = task.getProgress();
    double bytesDownloaded = static_cast<double>(task.getBytesReceived());
    int filled = 0;

    if (progress >= 0.0)
    {
        filled = static_cast<int>((progress / 100.0) * BAR_WIDTH);
        filled = std::min(filled, BAR_WIDTH);
    }

    // [=======>   ] <progress>% (<currentBytes> / <totalBytes>) ETA: <time remaining> @ <speed>/s
    mvwaddstr(win, currentRow, 0, std::string(LEFT_PADDING, ' ').c_str());
    waddch(win, '[');
    for (int j = 0; j < BAR_WIDTH; ++j)
    {
        if (j < filled)
            waddch(win, '=');
        else if (j == filled)
            waddch(win, isActive ? '>' : '|');
        else
            waddch(win, ' ');
    }
    waddch(win, ']');

    // Print percentage progress and size info
    if (!task.getTotalBytes())
    {
        wprintw(win, " %s (size unknown)", formatBytes(bytesDownloaded).c_str());
    }
    else
    {
        std::string currentStr = formatBytes(bytesDownloaded);
        std::string totalStr = formatBytes(static_cast<double>(*task.getTotalBytes()));
        wprintw(win, " %.1f%% (%s / %s)", progress, currentStr.c_str(), totalStr.c_str());
    }

    // If active, show ETA and speed
    if (isActive)
    {
        double speed = updateSpeed(task);
        std::string speedStr = formatBytes(speed);

        if (speed > 0.0 && task.getTotalBytes())
        {
            double remaining = static_cast<double>(*task.getTotalBytes()) - bytesDownloaded;
            wprintw(win, " ETA: %s @ %s/s", formatDuration(static_cast<std::uint64_t>(remaining / speed)).c_str(),
                    speedStr.c_str());
        }
        else
            wprintw(win, " ETA: -- @ %s/s", speedStr.c_str());
    }
}

#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

#include "ui/HistoryScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

HistoryScreen::HistoryScreen(DownloadManager &manager, UI &ui)
    : Screen(manager, ui),
      _commandTable{
          {{"search", "/"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseSearchCommand(command);
           }},
          {{"remove", "rm"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseRemoveCommand(command);
           }},
          {{"clear", "c"},
           MatchType::EXACT,
           [this](const std::string & /*command*/)
           {
               _manager.clearHistory();
           }},
          {{"back", "b", ""},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::ACTIVE);
           }}}
{
}

void HistoryScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "search [text] | Filter by URL or file (all if omitted)");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "remove <n|id> | Remove an entry");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "clear         | Clear download history");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "back          | Return to downloads (%zu)",
              _manager.getTasks().size());
}

void HistoryScreen::drawScreen(int &currentRow, WINDOW *win)
{
    std::vector<CompletedTask> entries = getEntries();

    if (!_query.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Matching \"%s\": %zu", _query.c_str(), entries.size());
    }
    else if (entries.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Completed downloads: None");
        return;
    }
    else
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Completed Downloads: %zu", entries.size());
    }

    for (size_t i = 0; i < entries.size(); ++i)
    {
        const CompletedTask &entry = entries[i];
        // <index>) <time> - <url> [<outcome>]
        mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "%zu) %s - %s [%s]",
                  i + 1,
                  formatTime(entry.completedAt).c_str(),
                  entry.url.c_str(),
                  toString(entry.outcome));
        // Saved to <destination> (<size> in <duration>, <speed>/s)
        mvwprintw(win, ++currentRow, LEFT_PADDING + 3, "Saved to %s (%s in %s, %s/s)",
                  entry.destination.c_str(),
                  formatBytes(static_cast<double>(entry.totalBytes)).c_str(),
                  formatDuration(entry.durationSecs).c_str(),
                  formatBytes(entry.getAverageSpeed()).c_str());
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

std::vector<CompletedTask> HistoryScreen::getEntries() const
{
    return _query.empty() ? _manager.getHistory() : _manager.searchHistory(_query);
}

void HistoryScreen::parseSearchCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    _query = args.empty() ? "" : args[0];
}

void HistoryScreen::parseRemoveCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: remove <n|id>");
        return;
    }

    std::vector<std::string> ids;
    for (const auto &entry : getEntries())
    {
        ids.push_back(entry.id);
    }

    _manager.removeHistory(resolveId(args[0], ids));
}

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "core/HistoryStore.hpp"
#include "core/ManagerError.hpp"
#include "util/file.hpp"
#include "util/format.hpp"
#include "util/id.hpp"
#include "util/log.hpp"

namespace
{
    bool containsIgnoreCase(const std::string &text, const std::string &loweredQuery)
    {
        return toLowerCase(text).find(loweredQuery) != std::string::npos;
    }
}

const char *toString(CompletionOutcome outcome)
{
    switch (outcome)
    {
    case CompletionOutcome::SUCCEEDED:
        return "Succeeded";
    case CompletionOutcome::CANCELLED:
        return "Cancelled";
    case CompletionOutcome::FAILED:
        return "Failed";
    }
    return "Unknown";
}

double CompletedTask::getAverageSpeed() const
{
    if (durationSecs == 0)
        return 0.0;

    return static_cast<double>(totalBytes) / static_cast<double>(durationSecs);
}

HistoryStore::HistoryStore(std::string filePath, size_t maxEntries)
    : _filePath(std::move(filePath)),
      _maxEntries(std::max<size_t>(maxEntries, 1))
{
    load();
}

std::string HistoryStore::add(CompletedTask entry)
{
    std::lock_guard<std::mutex> lock(_mutex);

    if (entry.id.empty())
    {
        entry.id = generateId("h-");
    }

    // An entry with the same id is replaced, so ids stay unique
    _entries.erase(std::remove_if(_entries.begin(), _entries.end(),
                                  [&entry](const CompletedTask &existing)
                                  { return existing.id == entry.id; }),
                   _entries.end());

    // Keep the list ordered by completion time, newest first
    auto position = std::find_if(_entries.begin(), _entries.end(),
                                 [&entry](const CompletedTask &existing)
                                 { return existing.completedAt <= entry.completedAt; });
    _entries.insert(position, entry);

    while (_entries.size() > _maxEntries)
    {
        _entries.pop_back();
    }

    saveLocked();
    return entry.id;
}

std::vector<CompletedTask> HistoryStore::list() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return std::vector<CompletedTask>(_entries.begin(), _entries.end());
}

void HistoryStore::remove(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = std::find_if(_entries.begin(), _entries.end(),
                           [&id](const CompletedTask &entry)
                           { return entry.id == id; });
    if (it == _entries.end())
    {
        throw ManagerError(ErrorKind::NOT_FOUND, "No history entry with id " + id);
    }

    _entries.erase(it);
    saveLocked();
}

// Clears all history entries
void HistoryStore::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _entries.clear();
    saveLocked();
}

std::vector<CompletedTask> HistoryStore::search(const std::string &query) const
{
    const std::string loweredQuery = toLowerCase(query);

    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<CompletedTask> matches;
    for (const auto &entry : _entries)
    {
        if (containsIgnoreCase(entry.url, loweredQuery) || containsIgnoreCase(entry.destination, loweredQuery))
        {
            matches.push_back(entry);
        }
    }

    return matches;
}

size_t HistoryStore::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}

//------------------------------------------------------------------------------
// Loading and saving history from and to disk
//------------------------------------------------------------------------------

void HistoryStore::load()
{
    if (_filePath.empty())
        return;

    std::ifstream inFile(_filePath);
    if (!inFile.is_open())
    {
        return; // No file => nothing to load
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(inFile, line))
    {
        ++lineNumber;
        if (line.empty())
            continue;

        std::istringstream iss(line);
        CompletedTask entry;
        int outcomeInt;

        if (!(iss >> std::quoted(entry.id)
                  >> std::quoted(entry.url)
                  >> std::quoted(entry.destination)
                  >> entry.totalBytes
                  >> entry.durationSecs
                  >> entry.completedAt
                  >> outcomeInt) ||
            outcomeInt < static_cast<int>(CompletionOutcome::SUCCEEDED) ||
            outcomeInt > static_cast<int>(CompletionOutcome::FAILED))
        {
            logging::warn("Skipping malformed history entry on line {} of {}", lineNumber, _filePath);
            continue;
        }

        entry.outcome = static_cast<CompletionOutcome>(outcomeInt);
        _entries.push_back(entry);
    }

    std::stable_sort(_entries.begin(), _entries.end(),
                     [](const CompletedTask &a, const CompletedTask &b)
                     { return a.completedAt > b.completedAt; });
    while (_entries.size() > _maxEntries)
    {
        _entries.pop_back();
    }
}

void HistoryStore::saveLocked() const
{
    if (_filePath.empty())
        return;

    std::ostringstream out;
    for (const auto &entry : _entries)
    {
        out << std::quoted(entry.id) << " "
            << std::quoted(entry.url) << " "
            << std::quoted(entry.destination) << " "
            << entry.totalBytes << " "
            << entry.durationSecs << " "
            << entry.completedAt << " "
            << static_cast<int>(entry.outcome) << "\n";
    }

    if (!writeFileAtomically(_filePath, out.str()))
    {
        logging::error("Failed to save history to {}", _filePath);
    }
}

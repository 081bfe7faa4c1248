#ifndef HISTORYSTORE_HPP
#define HISTORYSTORE_HPP

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <cstdint>
#include <ctime>

static constexpr const char RDM_HISTORY_FILENAME[] = "history";
static constexpr size_t RDM_HISTORY_MAX_ENTRIES = 100;

enum class CompletionOutcome
{
    SUCCEEDED,
    CANCELLED,
    FAILED
};

const char *toString(CompletionOutcome outcome);

// Immutable record of a finished transfer
struct CompletedTask
{
    std::string id;
    std::string url;
    std::string destination;
    std::uint64_t totalBytes{0};
    std::uint64_t durationSecs{0};
    time_t completedAt{0};
    CompletionOutcome outcome{CompletionOutcome::SUCCEEDED};

    // Bytes per second over the whole transfer, 0 when it took no measurable time
    double getAverageSpeed() const;
};

// Bounded, persisted list of finished transfers, most recent first
class HistoryStore
{
public:
    // With a non-empty filePath the store loads from and saves to that file
    explicit HistoryStore(std::string filePath = "", size_t maxEntries = RDM_HISTORY_MAX_ENTRIES);

    HistoryStore(const HistoryStore &) = delete;
    HistoryStore &operator=(const HistoryStore &) = delete;

    // Stores the record as given; an empty id is replaced by a fresh one and an existing
    // entry with the same id is replaced. Returns the id.
    std::string add(CompletedTask entry);

    std::vector<CompletedTask> list() const;

    // Throws ManagerError(NOT_FOUND) for an unknown id
    void remove(const std::string &id);
    void clear();

    // Case-insensitive substring match over URL and destination; an empty query matches all
    std::vector<CompletedTask> search(const std::string &query) const;

    size_t size() const;

private:
    std::string _filePath;
    size_t _maxEntries;

    mutable std::mutex _mutex;
    std::deque<CompletedTask> _entries; // newest at the front

    void load();
    void saveLocked() const;
};

#endif

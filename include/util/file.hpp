#ifndef FILE_HPP
#define FILE_HPP

#include <string>
#include <cstdint>
#include <optional>
#include <functional>

static constexpr const char RDM_STATE_DIRECTORY[] = "rdm";
static constexpr const char RDM_STATE_DIR_ENV[] = "RDM_STATE_DIR";

bool fileExists(const std::string &path);
bool isDirectory(const std::string &path);
std::optional<std::uint64_t> fileSize(const std::string &path);
// Appends __1, __2, ... to the base name until isTaken rejects the candidate
std::string getUniqueFilename(const std::string &originalPath,
                              const std::function<bool(const std::string &)> &isTaken = fileExists);

// Lexically normalised absolute form of a path, used to compare destinations
std::string normalisePath(const std::string &path);

// True if a file could be created or overwritten at path (parent directory exists and is
// writable, the path itself is not a directory, and an existing file is writable)
bool isWritableDestination(const std::string &path);

// Joins a directory and a file name with a single separator
std::string joinPath(const std::string &directory, const std::string &filename);

// Returns the directory where state files live ($RDM_STATE_DIR, else ~/.rdm), creating it if necessary
std::string getStateDirectory();

// Replaces the file at path with content by writing a sibling temporary file and renaming it
bool writeFileAtomically(const std::string &path, const std::string &content);

#endif

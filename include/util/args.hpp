#ifndef ARGS_HPP
#define ARGS_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Splits a command line into arguments after the command token; double quotes group spaces
std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs);

// Parses a non-negative decimal number, rejecting signs, blanks and trailing characters
std::optional<std::uint64_t> parseUnsigned(const std::string &text);

// Parses on/off style flags (on, off, true, false, yes, no, 1, 0)
std::optional<bool> parseFlag(const std::string &text);

#endif

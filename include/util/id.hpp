#ifndef ID_HPP
#define ID_HPP

#include <string>

// Random 16 hex digit identifier with an optional prefix, e.g. "t-3f9a0c12d4e5b678"
std::string generateId(const std::string &prefix);

#endif

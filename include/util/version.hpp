#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>

#ifndef RDM_VERSION
#define RDM_VERSION "0.0.0"
#endif

// Compares two semantic versions ("v1.2.3", "1.2", "1.3.0-beta.1").
// Returns -1, 0 or 1. Missing numeric components count as zero and a
// pre-release ranks below the release it precedes.
int compareVersions(const std::string &a, const std::string &b);

#endif

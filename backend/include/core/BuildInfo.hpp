#pragma once

#include <string>

namespace lanscout::buildinfo {

inline std::string git_commit() {
#ifdef LANSCOUT_GIT_COMMIT
    return std::string(LANSCOUT_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    // Not truly UTC, but stable and available without runtime deps.
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

inline std::string version_line() {
    return "lanscout (commit " + git_commit() + ", built " + build_time_utc_approx() + ")";
}

} // namespace lanscout::buildinfo

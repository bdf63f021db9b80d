#pragma once

#include <string>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// True if the string is empty or whitespace only.
inline bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Read an environment variable; empty string if unset.
std::string env_or_empty(const char* name);

// Describe errno as "message (errno N)".
std::string errno_message(int err);

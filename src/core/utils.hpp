#pragma once

#include <string>
#include <cstdint>
#include <optional>

// Strict unsigned parse: digits only, no sign, no trailing junk, no overflow.
std::optional<uint64_t> parse_u64(const std::string& s);

// Quote a string for a POSIX shell command line ('it'"'"'s').
std::string shell_quote(const std::string& s);

// Remove every carriage return (remote output may carry CRLF line ends).
std::string strip_cr(const std::string& s);

// Human-readable byte count: "512 B", "4.00 MB", "1.50 GB".
std::string format_bytes(uint64_t bytes);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

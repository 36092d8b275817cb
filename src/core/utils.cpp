#include "utils.hpp"
#include <fmt/format.h>
#include <limits>

std::optional<uint64_t> parse_u64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string strip_cr(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '\r') out += c;
    }
    return out;
}

std::string format_bytes(uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    double b = static_cast<double>(bytes);
    if (b >= GB) return fmt::format("{:.2f} GB", b / GB);
    if (b >= MB) return fmt::format("{:.2f} MB", b / MB);
    if (b >= KB) return fmt::format("{:.2f} KB", b / KB);
    return fmt::format("{} B", bytes);
}

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace util {
    void setup_logging(const std::string& logger_name, const std::string& level);

    // Time utilities
    std::string current_iso8601();
    std::string to_iso8601(std::chrono::system_clock::time_point tp);
    // Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction and "Z" / "+00:00";
    // throws std::invalid_argument otherwise
    std::chrono::system_clock::time_point parse_iso8601(const std::string& ts);

    // String utilities
    std::string to_lower(const std::string& s);
    std::string trim(const std::string& s);
    std::vector<std::string> split_words(const std::string& s);
}

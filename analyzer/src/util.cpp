#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

void setup_logging(const std::string& logger_name, const std::string& level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(logger_name, console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::info);
}

std::string current_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& ts) {
    std::tm tm = {};
    std::istringstream ss(ts);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("invalid ISO-8601 timestamp: " + ts);
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    // Optional fractional seconds
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (!digits.empty()) {
            digits = digits.substr(0, 3);
            while (digits.size() < 3) {
                digits.push_back('0');
            }
            tp += std::chrono::milliseconds(std::stoi(digits));
        }
    }

    // Zone designator; offsets other than UTC are applied
    int c = ss.peek();
    if (c == 'Z') {
        ss.get();
    } else if (c == '+' || c == '-') {
        char sign = static_cast<char>(ss.get());
        std::string rest;
        ss >> rest;
        rest.erase(std::remove(rest.begin(), rest.end(), ':'), rest.end());
        if (rest.size() != 4 || !std::all_of(rest.begin(), rest.end(),
                                              [](unsigned char d) { return std::isdigit(d); })) {
            throw std::invalid_argument("invalid ISO-8601 offset: " + ts);
        }
        int hours = std::stoi(rest.substr(0, 2));
        int minutes = std::stoi(rest.substr(2, 2));
        auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
        tp = sign == '+' ? tp - offset : tp + offset;
    }

    return tp;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string current;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

}

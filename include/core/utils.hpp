#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <format>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace docanon::utils {

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char tz_buf[8];
    std::strftime(tz_buf, sizeof(tz_buf), "%z", &tm_buf);

    return std::format("{}.{:03d}{}", time_buf, static_cast<int>(ms.count()), tz_buf);
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

// ============================================================================
// Type-Safe Range Check (eliminates impossible comparisons at compile time)
// ============================================================================

template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    using Common = std::common_type_t<T, decltype(Lo), decltype(Hi)>;
    bool below = false;
    bool above = false;
    if constexpr (static_cast<Common>(std::numeric_limits<T>::min()) >= static_cast<Common>(Lo)) {
        (void)value; // T can never be below Lo
    } else {
        below = static_cast<Common>(value) < static_cast<Common>(Lo);
    }
    if constexpr (static_cast<Common>(std::numeric_limits<T>::max()) <= static_cast<Common>(Hi)) {
        (void)value; // T can never exceed Hi
    } else {
        above = static_cast<Common>(value) > static_cast<Common>(Hi);
    }
    return !below && !above;
}

// ============================================================================
// Numeric Parsing (std::from_chars)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string to_upper(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

[[nodiscard]] inline bool is_blank(std::string_view str) {
    return str.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos;
}

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

/**
 * @brief Split a comma-separated CLI/config list, trimming each item and
 * dropping empty ones.
 */
inline std::vector<std::string> split_list(const std::string& str) {
    std::vector<std::string> items;
    for (auto& item : split(str, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            items.emplace_back(std::move(trimmed));
        }
    }
    return items;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

    double elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr + optional file, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    struct State {
        std::mutex mutex;
        Level min_level = Level::INFO;
        std::ofstream file;
    };

    inline State& state() {
        static State s;
        return s;
    }

    inline void write(Level level, const std::string& msg) {
        auto& s = state();
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            if (level < s.min_level) return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(s.mutex);
        std::cerr << formatted;
        if (s.file.is_open()) {
            s.file << formatted;
            s.file.flush();
        }
    }
} // namespace detail

[[nodiscard]] inline std::optional<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (const char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void set_level(Level level) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.min_level = level;
}

/**
 * @brief Mirror log lines to a file (append mode). Empty path closes it.
 * @return false if the file could not be opened
 */
inline bool set_file(const std::string& path) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) s.file.close();
    if (path.empty()) return true;
    s.file.open(path, std::ios::app);
    return s.file.is_open();
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace docanon::utils

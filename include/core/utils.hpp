#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <vector>

#include <unistd.h>

namespace sqlanon::utils {

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

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Join strings with a separator ("a", "b" + ", " => "a, b")
 */
inline std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

// ============================================================================
// Human-Readable Sizes and Durations
// ============================================================================

/**
 * @brief Format a duration: "850 ms", "3.214 s", "2 m 05 s", "1 h 02 m"
 */
[[nodiscard]] inline std::string format_duration(std::chrono::milliseconds ms) {
    const auto total = ms.count();
    if (total < 1000) {
        return std::format("{} ms", total);
    }
    if (total < 60'000) {
        return std::format("{:.3f} s", static_cast<double>(total) / 1000.0);
    }
    const auto seconds = total / 1000;
    if (seconds < 3600) {
        return std::format("{} m {:02d} s", seconds / 60, seconds % 60);
    }
    return std::format("{} h {:02d} m", seconds / 3600, (seconds % 3600) / 60);
}

/**
 * @brief Format a byte count with binary units: "512 B", "1.50 MiB"
 */
[[nodiscard]] inline std::string format_memory(uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return std::format("{:.2f} {}", value, kUnits[unit]);
}

/**
 * @brief Current resident set size of this process, 0 when unknown.
 * Reads the second field of /proc/self/statm (pages).
 */
[[nodiscard]] inline uint64_t resident_memory_bytes() {
    std::ifstream statm("/proc/self/statm");
    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return 0;
    }
    const long page_size = ::sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<uint64_t>(page_size > 0 ? page_size : 4096);
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

    /**
     * @brief Progress summary: "time: 1.204 s, mem: 12.00 MiB"
     */
    [[nodiscard]] std::string summary() const {
        return std::format("time: {}, mem: {}",
            format_duration(elapsed_ms()), format_memory(resident_memory_bytes()));
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline Level& min_level() {
        static Level level = Level::INFO;
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < static_cast<int>(min_level())) {
            return;
        }

        const char* tag = "";
        switch (level) {
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

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::min_level() = level;
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

} // namespace sqlanon::utils

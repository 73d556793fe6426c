// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Log.h
 * @brief Leveled logging with std::format and source locations
 *
 * Each line is written to std::cerr as
 * `[YYYY-MM-DD HH:MM:SS.mmm] LEVEL: message (file:line)`.
 *
 * @code
 * SuperLocker::Log::set_level(SuperLocker::Log::level_from_string("debug"));
 * SuperLocker::Log::info("Migrated {} of {} records", migrated, total);
 * @endcode
 *
 * @warning Never pass secrets, derived keys or decrypted plaintext to these
 *          functions. Log sizes, counts and identifiers only.
 */

#ifndef SUPERLOCKER_LOG_H
#define SUPERLOCKER_LOG_H

#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>

namespace SuperLocker::Log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

/** @brief Minimum level that is printed (default Info) */
inline std::atomic<Level> current_level{Level::Info};

namespace detail {
    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO ";
            case Level::Warning: return "WARN ";
            case Level::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    }

    inline void write(Level level, std::string_view message, const std::source_location& loc) {
        std::cerr << std::format("[{}] {}: {} ({}:{})\n",
            get_timestamp(), level_to_string(level), message,
            loc.file_name(), loc.line());
    }
}

/**
 * @brief Format string bundled with the caller's source location
 *
 * Lets the convenience functions below report the call site instead of
 * this header.
 */
template<typename... Args>
struct FormatWithLocation {
    std::format_string<Args...> fmt;
    std::source_location loc;

    template<typename T>
    consteval FormatWithLocation(const T& s,
                                 std::source_location l = std::source_location::current())
        : fmt(s), loc(l) {}
};

template<typename... Args>
void log(Level level, FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    if (level < current_level.load(std::memory_order_relaxed)) {
        return;
    }
    detail::write(level, std::format(fmt.fmt, std::forward<Args>(args)...), fmt.loc);
}

template<typename... Args>
void debug(FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(FormatWithLocation<std::type_identity_t<Args>...> fmt, Args&&... args) {
    log<Args...>(Level::Error, fmt, std::forward<Args>(args)...);
}

inline void set_level(Level level) {
    current_level.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level get_level() {
    return current_level.load(std::memory_order_relaxed);
}

/**
 * @brief Parse the `log-level` setting value
 * @param name "debug", "info", "warning" or "error"
 * @return Matching level; Info for anything else
 */
[[nodiscard]] inline Level level_from_string(std::string_view name) noexcept {
    if (name == "debug")   return Level::Debug;
    if (name == "warning") return Level::Warning;
    if (name == "error")   return Level::Error;
    return Level::Info;
}

} // namespace SuperLocker::Log

#endif // SUPERLOCKER_LOG_H

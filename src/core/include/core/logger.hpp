/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace hdriv::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

    /**
     * @brief Process-wide logger backed by spdlog
     *
     * Logs to stderr and, when configured, to a file. Use the LOG_* macros so
     * the call site is recorded.
     */
    class Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info, const std::string& log_file = "");
        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const;

        template <typename... Args>
        void log(const LogLevel level,
                 const std::source_location& loc,
                 spdlog::format_string_t<Args...> fmt,
                 Args&&... args) {
            auto sink = current();
            const auto lvl = to_spdlog(level);
            if (!sink->should_log(lvl)) {
                return;
            }
            sink->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                      lvl, fmt, std::forward<Args>(args)...);
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        Logger();

        [[nodiscard]] std::shared_ptr<spdlog::logger> current() const;
        static spdlog::level::level_enum to_spdlog(LogLevel level);

        mutable std::mutex mutex_;
        std::shared_ptr<spdlog::logger> logger_;
        LogLevel level_ = LogLevel::Info;
    };

} // namespace hdriv::core

#define LOG_TRACE(...) ::hdriv::core::Logger::get().log(::hdriv::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)
#define LOG_DEBUG(...) ::hdriv::core::Logger::get().log(::hdriv::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)
#define LOG_INFO(...) ::hdriv::core::Logger::get().log(::hdriv::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)
#define LOG_WARN(...) ::hdriv::core::Logger::get().log(::hdriv::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)
#define LOG_ERROR(...) ::hdriv::core::Logger::get().log(::hdriv::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)
#define LOG_CRITICAL(...) ::hdriv::core::Logger::get().log(::hdriv::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

/* SPDX-FileCopyrightText: 2025 HDRIV Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace hdriv::core {

    namespace {
        constexpr const char* LOGGER_NAME = "hdriv";
        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
    } // namespace

    std::optional<LogLevel> parse_log_level(const std::string_view name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return std::nullopt;
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(console));
        logger_->set_pattern(LOG_PATTERN);
        logger_->set_level(to_spdlog(level_));
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        std::string file_error;
        if (!log_file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        auto fresh = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        fresh->set_pattern(LOG_PATTERN);
        fresh->set_level(to_spdlog(console_level));
        fresh->flush_on(spdlog::level::warn);

        {
            std::lock_guard lock(mutex_);
            logger_ = fresh;
            level_ = console_level;
        }

        if (!file_error.empty()) {
            fresh->warn("Cannot open log file '{}', logging to console only: {}", log_file, file_error);
        }
    }

    void Logger::set_level(const LogLevel level) {
        std::lock_guard lock(mutex_);
        level_ = level;
        logger_->set_level(to_spdlog(level));
    }

    LogLevel Logger::level() const {
        std::lock_guard lock(mutex_);
        return level_;
    }

    std::shared_ptr<spdlog::logger> Logger::current() const {
        std::lock_guard lock(mutex_);
        return logger_;
    }

    spdlog::level::level_enum Logger::to_spdlog(const LogLevel level) {
        switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
        }
        return spdlog::level::info;
    }

} // namespace hdriv::core

/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <source_location>
#include <spdlog/spdlog.h>
#include <string>

namespace mrn::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    /**
     * @brief Process-wide logger backed by spdlog
     *
     * The first call to get() creates a colored console logger at Info level.
     * init() may be called again to change the level or to add a file sink.
     */
    class MRN_CORE_API Logger {
    public:
        static Logger& get();

        void init(LogLevel level = LogLevel::Info, const std::string& log_file = "");

        void setLevel(LogLevel level);
        [[nodiscard]] LogLevel level() const { return level_.load(std::memory_order_relaxed); }
        [[nodiscard]] bool shouldLog(LogLevel level) const {
            const LogLevel current = level_.load(std::memory_order_relaxed);
            return level >= current && current != LogLevel::Off;
        }

        template <typename... Args>
        void log(LogLevel level, const std::source_location& loc,
                 spdlog::format_string_t<Args...> fmt, Args&&... args) {
            if (!shouldLog(level)) {
                return;
            }
            std::lock_guard lock(mutex_);
            logger_->log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
                         toSpdlog(level), fmt, std::forward<Args>(args)...);
        }

        void flush();

    private:
        Logger();

        static spdlog::level::level_enum toSpdlog(LogLevel level);

        std::shared_ptr<spdlog::logger> logger_;
        // Read without the mutex on every log call
        std::atomic<LogLevel> level_{LogLevel::Info};
        std::mutex mutex_;
    };

    // Logs the lifetime of a scope at debug level
    class MRN_CORE_API ScopedTimer {
    public:
        explicit ScopedTimer(std::string name,
                             const std::source_location& loc = std::source_location::current());
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string name_;
        std::source_location loc_;
        std::chrono::steady_clock::time_point start_;
    };

} // namespace mrn::core

#define LOG_TRACE(...)    ::mrn::core::Logger::get().log(::mrn::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)
#define LOG_DEBUG(...)    ::mrn::core::Logger::get().log(::mrn::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)
#define LOG_INFO(...)     ::mrn::core::Logger::get().log(::mrn::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)
#define LOG_WARN(...)     ::mrn::core::Logger::get().log(::mrn::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)
#define LOG_ERROR(...)    ::mrn::core::Logger::get().log(::mrn::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)
#define LOG_CRITICAL(...) ::mrn::core::Logger::get().log(::mrn::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define MRN_LOG_CONCAT_INNER(a, b) a##b
#define MRN_LOG_CONCAT(a, b)       MRN_LOG_CONCAT_INNER(a, b)
#define LOG_TIMER(name)            ::mrn::core::ScopedTimer MRN_LOG_CONCAT(mrn_scoped_timer_, __LINE__)(name)

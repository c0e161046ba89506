/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace mrn::core {

    namespace {
        constexpr const char* LOGGER_NAME = "marionette";
        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
    } // namespace

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, console);
        logger_->set_pattern(LOG_PATTERN);
        logger_->set_level(toSpdlog(level_.load()));
    }

    void Logger::init(LogLevel level, const std::string& log_file) {
        std::lock_guard lock(mutex_);

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        std::string file_error;
        if (!log_file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger_->set_pattern(LOG_PATTERN);
        level_ = level;
        logger_->set_level(toSpdlog(level));

        if (!file_error.empty()) {
            logger_->warn("Cannot open log file '{}': {}", log_file, file_error);
        }
    }

    void Logger::setLevel(LogLevel level) {
        std::lock_guard lock(mutex_);
        level_ = level;
        logger_->set_level(toSpdlog(level));
    }

    void Logger::flush() {
        std::lock_guard lock(mutex_);
        logger_->flush();
    }

    spdlog::level::level_enum Logger::toSpdlog(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    ScopedTimer::ScopedTimer(std::string name, const std::source_location& loc)
        : name_(std::move(name)),
          loc_(loc),
          start_(std::chrono::steady_clock::now()) {}

    ScopedTimer::~ScopedTimer() {
        const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_);
        Logger::get().log(LogLevel::Debug, loc_, "{} took {:.3f} ms", name_, elapsed.count());
    }

} // namespace mrn::core

/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace dhr::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    enum class LogModule : uint8_t {
        Core = 0,
        Store = 1,
        Planner = 2,
        Pipeline = 3,
        Stage = 4,
        IO = 5,
        App = 6,
        Unknown = 7,
        Count = 8
    };

    /// Module of a call site, inferred from its source path
    LogModule log_module_for(std::string_view path);

    // Parses "core", "store", "planner", "pipeline", "stage", "io", "app"
    bool parse_log_module(std::string_view name, LogModule& module);

    // Parses "trace", "debug", "info", "perf", "warn", "error", "critical", "off"
    bool parse_log_level(std::string_view name, LogLevel& level);

    class Logger {
    public:
        static Logger& get();

        void init(LogLevel console_level = LogLevel::Info, const std::string& log_file = "");

        // Log a pre-formatted message (called by macros)
        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        /// Threshold for one module, replacing the global level there; Off silences it
        void set_module_level(LogModule module, LogLevel level);
        void inherit_module_level(LogModule module);
        void flush();

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            log(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static constexpr uint8_t INHERIT_LEVEL = 0xFF;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Scoped timer for stage wall/CPU time
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::steady_clock::time_point start_;
        std::clock_t cpu_start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace dhr::core

// Global macros
#define LOG_TRACE(...) \
    ::dhr::core::Logger::get().log_internal(::dhr::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::dhr::core::Logger::get().log_internal(::dhr::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::dhr::core::Logger::get().log_internal(::dhr::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::dhr::core::Logger::get().log_internal(::dhr::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::dhr::core::Logger::get().log_internal(::dhr::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define DHR_TIMER_CONCAT_INNER(a, b) a##b
#define DHR_TIMER_CONCAT(a, b)       DHR_TIMER_CONCAT_INNER(a, b)
#define LOG_TIMER(name)              ::dhr::core::ScopedTimer DHR_TIMER_CONCAT(_timer, __LINE__)(name)

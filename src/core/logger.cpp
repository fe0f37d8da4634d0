/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <cstdio>
#include <mutex>
#include <utility>
#include <vector>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace dhr::core {

    namespace {
        constexpr const char* ANSI_RESET = "\033[0m";
        constexpr std::string_view PERF_TAG = "[PERF] ";

        struct LevelStyle {
            const char* color;
            const char* name;
        };

        LevelStyle style_for(const spdlog::level::level_enum level) {
            switch (level) {
            case spdlog::level::trace:    return {"\033[37m", "trace"};
            case spdlog::level::debug:    return {"\033[36m", "debug"};
            case spdlog::level::warn:     return {"\033[33m", "warn"};
            case spdlog::level::err:      return {"\033[31m", "error"};
            case spdlog::level::critical: return {"\033[1;31m", "critical"};
            default:                      return {"\033[32m", "info"};
            }
        }

        // "[hh:mm:ss.mmm] [level] file.cpp:line  message" on stderr; timer
        // reports arrive tagged and are shown with their own level name
        class ConsoleSink final : public spdlog::sinks::base_sink<std::mutex> {
        protected:
            void sink_it_(const spdlog::details::log_msg& msg) override {
                const auto seconds = std::chrono::system_clock::to_time_t(msg.time);
                std::tm tm{};
                localtime_r(&seconds, &tm);
                const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        msg.time.time_since_epoch()).count() % 1000;

                std::string_view file = msg.source.filename ? msg.source.filename : "";
                if (const auto slash = file.find_last_of('/'); slash != std::string_view::npos) {
                    file.remove_prefix(slash + 1);
                }

                std::string_view text(msg.payload.data(), msg.payload.size());
                LevelStyle style = style_for(msg.level);
                if (text.starts_with(PERF_TAG)) {
                    text.remove_prefix(PERF_TAG.size());
                    style = {"\033[95m", "perf"};
                }

                std::fprintf(stderr, "[%02d:%02d:%02d.%03d] %s[%s]%s %.*s:%d  %.*s\n",
                             tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis),
                             style.color, style.name, ANSI_RESET,
                             static_cast<int>(file.size()), file.data(), msg.source.line,
                             static_cast<int>(text.size()), text.data());
            }

            void flush_() override { std::fflush(stderr); }
        };

        constexpr std::pair<std::string_view, LogModule> MODULE_NAMES[] = {
            {"core", LogModule::Core},         {"store", LogModule::Store}, {"planner", LogModule::Planner},
            {"pipeline", LogModule::Pipeline}, {"stage", LogModule::Stage}, {"io", LogModule::IO},
            {"app", LogModule::App}};

        constexpr spdlog::level::level_enum to_spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace:       return spdlog::level::trace;
            case LogLevel::Debug:       return spdlog::level::debug;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn:        return spdlog::level::warn;
            case LogLevel::Error:       return spdlog::level::err;
            case LogLevel::Critical:    return spdlog::level::critical;
            case LogLevel::Off:         return spdlog::level::off;
            default:                    return spdlog::level::info;
            }
        }

        // A Performance threshold shows timer reports only; otherwise timer
        // reports pass at Info and below
        bool passes(const LogLevel level, const LogLevel threshold) {
            if (threshold == LogLevel::Performance)
                return level == LogLevel::Performance;
            if (level == LogLevel::Performance)
                return threshold <= LogLevel::Performance;
            return level >= threshold;
        }
    } // namespace

    LogModule log_module_for(const std::string_view path) {
        if (path.find("store") != std::string_view::npos)
            return LogModule::Store;
        if (path.find("planner") != std::string_view::npos || path.find("resource") != std::string_view::npos)
            return LogModule::Planner;
        if (path.find("stages") != std::string_view::npos)
            return LogModule::Stage;
        if (path.find("pipeline") != std::string_view::npos || path.find("polar") != std::string_view::npos)
            return LogModule::Pipeline;
        if (path.find("serialization") != std::string_view::npos || path.find("parameters") != std::string_view::npos)
            return LogModule::IO;
        if (path.find("app") != std::string_view::npos)
            return LogModule::App;
        if (path.find("core") != std::string_view::npos)
            return LogModule::Core;
        return LogModule::Unknown;
    }

    bool parse_log_module(const std::string_view name, LogModule& module) {
        for (const auto& [key, value] : MODULE_NAMES) {
            if (key == name) {
                module = value;
                return true;
            }
        }
        return false;
    }

    bool parse_log_level(const std::string_view name, LogLevel& level) {
        if (name == "trace") level = LogLevel::Trace;
        else if (name == "debug") level = LogLevel::Debug;
        else if (name == "info") level = LogLevel::Info;
        else if (name == "perf") level = LogLevel::Performance;
        else if (name == "warn") level = LogLevel::Warn;
        else if (name == "error") level = LogLevel::Error;
        else if (name == "critical") level = LogLevel::Critical;
        else if (name == "off") level = LogLevel::Off;
        else return false;
        return true;
    }

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::mutex mutex;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (auto& level : module_level_)
            level = INHERIT_LEVEL;
    }

    Logger::~Logger() = default;

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file) {
        std::lock_guard lock(impl_->mutex);

        // Sinks take everything; thresholds are applied per module in log()
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<ConsoleSink>()};
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
            sinks.push_back(std::move(file_sink));
        }

        impl_->logger = std::make_shared<spdlog::logger>("dhr", sinks.begin(), sinks.end());
        impl_->logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(impl_->logger);

        global_level_ = static_cast<uint8_t>(console_level);
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        if (!impl_->logger)
            return;

        const uint8_t module_level = module_level_[static_cast<size_t>(log_module_for(loc.file_name()))];
        const auto threshold = static_cast<LogLevel>(module_level == INHERIT_LEVEL ? global_level_.load()
                                                                                    : module_level);
        if (!passes(level, threshold))
            return;

        const spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
        if (level == LogLevel::Performance) {
            impl_->logger->log(where, to_spdlog_level(level), "{}{}", PERF_TAG, msg);
        } else {
            impl_->logger->log(where, to_spdlog_level(level), msg);
        }
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
    }

    void Logger::inherit_module_level(const LogModule module) {
        module_level_[static_cast<size_t>(module)] = INHERIT_LEVEL;
    }

    void Logger::flush() {
        if (impl_->logger)
            impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::steady_clock::now()),
          cpu_start_(std::clock()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        const auto wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        const double cpu = static_cast<double>(std::clock() - cpu_start_) / CLOCKS_PER_SEC;
        const double ratio = wall > 0.0 ? cpu / wall * 100.0 : 0.0;
        Logger::get().log(level_, loc_,
                          std::format("{:<32} Wall: {:10.3f} s, CPU: {:10.3f} s, ratio {:7.1f}%", name_, wall,
                                      cpu, ratio));
    }

} // namespace dhr::core

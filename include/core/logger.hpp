/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace srl::core {

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

    /// Library area a message comes from, derived from the source path
    enum class LogModule : uint8_t {
        Core = 0,
        Config = 1,
        Features = 2,
        Losses = 3,
        Other = 4,
        Count = 5
    };

    /// Module owning @p source_path ("src/losses/..." -> Losses, ...)
    LogModule module_of(std::string_view source_path);

    /**
     * @brief Process-wide logger on top of spdlog
     *
     * Messages below the current level are dropped before formatting. Each
     * module can be muted on its own, e.g. to silence per-layer loss traces
     * while keeping configuration messages.
     */
    class Logger {
    public:
        static Logger& get();

        /// Console sink on stderr at @p level; an optional file sink receives everything that passes the level
        void init(LogLevel level = LogLevel::Info, const std::string& log_file = "");

        void set_level(LogLevel level) { level_.store(static_cast<uint8_t>(level)); }
        LogLevel level() const { return static_cast<LogLevel>(level_.load()); }

        void enable_module(LogModule module, bool enabled = true);

        bool should_log(LogLevel level) const {
            return level != LogLevel::Off && static_cast<uint8_t>(level) >= level_.load();
        }

        void write(LogLevel level, const std::source_location& loc, std::string_view msg);
        void flush();

        template <typename... Args>
        void log(LogLevel level, const std::source_location& loc,
                 std::format_string<Args...> fmt, Args&&... args) {
            if (!should_log(level)) {
                return;
            }
            write(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> muted_{};
    };

    /// Logs "<name> took <ms>ms" at @p level when it goes out of scope
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace srl::core

#define SRL_LOG(level, ...) \
    ::srl::core::Logger::get().log(level, std::source_location::current(), __VA_ARGS__)

#define LOG_TRACE(...)    SRL_LOG(::srl::core::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    SRL_LOG(::srl::core::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)     SRL_LOG(::srl::core::LogLevel::Info, __VA_ARGS__)
#define LOG_PERF(...)     SRL_LOG(::srl::core::LogLevel::Performance, __VA_ARGS__)
#define LOG_WARN(...)     SRL_LOG(::srl::core::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...)    SRL_LOG(::srl::core::LogLevel::Error, __VA_ARGS__)
#define LOG_CRITICAL(...) SRL_LOG(::srl::core::LogLevel::Critical, __VA_ARGS__)

#define SRL_CONCAT_INNER(a, b) a##b
#define SRL_CONCAT(a, b)       SRL_CONCAT_INNER(a, b)

#define LOG_TIMER(name)       ::srl::core::ScopedTimer SRL_CONCAT(srl_timer_, __LINE__)(name)
#define LOG_TIMER_TRACE(name) ::srl::core::ScopedTimer SRL_CONCAT(srl_timer_, __LINE__)(name, ::srl::core::LogLevel::Trace)

/* SPDX-FileCopyrightText: 2025 SR Losses Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <mutex>
#include <utility>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace srl::core {

    namespace {
        // Most specific first: parameters.cpp lives under core/
        constexpr std::array<std::pair<std::string_view, LogModule>, 4> MODULE_PATHS = {{
            {"core/parameters", LogModule::Config},
            {"losses/", LogModule::Losses},
            {"features/", LogModule::Features},
            {"core/", LogModule::Core},
        }};

        constexpr std::array<std::string_view, 8> LEVEL_NAMES = {
            "trace", "debug", "info", "perf", "warn", "error", "critical", "off"};

        spdlog::level::level_enum to_spdlog(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace:       return spdlog::level::trace;
            case LogLevel::Debug:       return spdlog::level::debug;
            case LogLevel::Info:
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn:        return spdlog::level::warn;
            case LogLevel::Error:       return spdlog::level::err;
            case LogLevel::Critical:    return spdlog::level::critical;
            case LogLevel::Off:         return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        std::string_view basename(const std::string_view path) {
            const auto pos = path.find_last_of("/\\");
            return pos == std::string_view::npos ? path : path.substr(pos + 1);
        }
    } // namespace

    LogModule module_of(const std::string_view source_path) {
        for (const auto& [fragment, module] : MODULE_PATHS) {
            if (source_path.find(fragment) != std::string_view::npos) {
                return module;
            }
        }
        return LogModule::Other;
    }

    struct Logger::Impl {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> logger;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {}

    Logger::~Logger() = default;

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel level, const std::string& log_file) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, /*truncate=*/true));
        }

        // Level names are part of the payload so Performance keeps its own tag
        auto logger = std::make_shared<spdlog::logger>("srl", sinks.begin(), sinks.end());
        logger->set_pattern("[%H:%M:%S.%e] %^%v%$");
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::err);

        impl_->logger = std::move(logger);
        spdlog::set_default_logger(impl_->logger);
        set_level(level);
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        muted_[static_cast<size_t>(module)] = !enabled;
    }

    void Logger::write(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->logger || !should_log(level)) {
            return;
        }
        if (muted_[static_cast<size_t>(module_of(loc.file_name()))]) {
            return;
        }

        impl_->logger->log(to_spdlog(level), "[{}] {}:{}  {}",
                           LEVEL_NAMES[static_cast<size_t>(level)], basename(loc.file_name()), loc.line(), msg);
    }

    void Logger::flush() {
        std::lock_guard lock(impl_->mutex);
        if (impl_->logger) {
            impl_->logger->flush();
        }
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::steady_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        auto& logger = Logger::get();
        if (!logger.should_log(level_)) {
            return;
        }
        const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
        logger.write(level_, loc_, std::format("{} took {:.2f}ms", name_, ms));
    }

} // namespace srl::core

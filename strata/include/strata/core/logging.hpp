/*
 * File: logging.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-15
 * License: MIT
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

namespace strata::core {

    enum class log_level {
        debug = 0,
        info  = 1,
        warn  = 2,
        error = 3,
        off   = 4,
    };

    inline const char* to_string(log_level level) noexcept {
        switch (level) {
        case log_level::debug: return "DEBUG";
        case log_level::info:  return "INFO";
        case log_level::warn:  return "WARN";
        case log_level::error: return "ERROR";
        case log_level::off:   return "OFF";
        }
        return "UNKNOWN";
    }

    // Unknown names map to info.
    inline log_level parse_log_level(std::string_view name) noexcept {
        if (name == "debug" || name == "DEBUG") return log_level::debug;
        if (name == "warn" || name == "WARN" || name == "warning") return log_level::warn;
        if (name == "error" || name == "ERROR") return log_level::error;
        if (name == "off" || name == "OFF") return log_level::off;
        return log_level::info;
    }

    // Process-wide logger. Writes whole lines to a single sink under a mutex.
    class logger {
    public:

        static logger& instance() {
            static logger inst;
            return inst;
        }

        void set_level(log_level level) noexcept {
            level_.store(level, std::memory_order_relaxed);
        }

        log_level level() const noexcept {
            return level_.load(std::memory_order_relaxed);
        }

        bool enabled(log_level level) const noexcept {
            return level != log_level::off && level >= this->level();
        }

        void set_timestamps(bool on) noexcept {
            timestamps_.store(on, std::memory_order_relaxed);
        }

        // nullptr restores std::cerr
        void set_sink(std::ostream* out) {
            std::lock_guard<std::mutex> lck(mutex_);
            sink_ = out ? out : &std::cerr;
        }

        template <typename... Args>
        void write(log_level level, std::string_view component, Args&&... args) {
            if (!enabled(level)) {
                return;
            }
            std::ostringstream oss;
            if (timestamps_.load(std::memory_order_relaxed)) {
                const auto now = std::chrono::system_clock::now();
                const auto tt = std::chrono::system_clock::to_time_t(now);
                const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) % 1000;
                std::tm tm_buf{};
                localtime_r(&tt, &tm_buf);
                oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
                    << '.' << std::setfill('0') << std::setw(3) << ms.count() << ' ';
            }
            oss << '[' << to_string(level) << ']';
            if (!component.empty()) {
                oss << '[' << component << ']';
            }
            oss << ' ';
            ((oss << std::forward<Args>(args)), ...);
            oss << '\n';

            std::lock_guard<std::mutex> lck(mutex_);
            (*sink_) << oss.str();
            sink_->flush();
        }

    private:
        logger() = default;
        logger(const logger&) = delete;
        logger& operator = (const logger&) = delete;

        std::atomic<log_level> level_{ log_level::warn };
        std::atomic<bool> timestamps_{ false };
        std::mutex mutex_;
        std::ostream* sink_ = &std::cerr;
    };

    inline void set_log_level(log_level level) noexcept {
        logger::instance().set_level(level);
    }

} // namespace strata::core

#define STRATA_LOG(level, component, ...) \
    do { \
        if (::strata::core::logger::instance().enabled(level)) { \
            ::strata::core::logger::instance().write(level, component, __VA_ARGS__); \
        } \
    } while (0)

#define STRATA_LOG_DEBUG(component, ...) STRATA_LOG(::strata::core::log_level::debug, component, __VA_ARGS__)
#define STRATA_LOG_INFO(component, ...)  STRATA_LOG(::strata::core::log_level::info, component, __VA_ARGS__)
#define STRATA_LOG_WARN(component, ...)  STRATA_LOG(::strata::core::log_level::warn, component, __VA_ARGS__)
#define STRATA_LOG_ERROR(component, ...) STRATA_LOG(::strata::core::log_level::error, component, __VA_ARGS__)

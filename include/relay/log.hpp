/*
MIT License

Copyright (c) 2026 dakingffo

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/
#if defined(_MSC_VER) && _MSC_VER > 1000 || defined(__clang__) || (defined(__GNUC__) && __GNUC__ >= 3)
#pragma once
#endif

#ifndef RELAY_LOG_HPP
#define RELAY_LOG_HPP

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "config.hpp"

// Integer constants for preprocessor comparisons.
#define RELAY_LOG_LEVEL_NONE  0
#define RELAY_LOG_LEVEL_ERROR 1
#define RELAY_LOG_LEVEL_WARN  2
#define RELAY_LOG_LEVEL_INFO  3
#define RELAY_LOG_LEVEL_DEBUG 4
#define RELAY_LOG_LEVEL_TRACE 5

#ifndef RELAY_LOG_BUILD_LEVEL
#define RELAY_LOG_BUILD_LEVEL RELAY_LOG_LEVEL_DEBUG
#endif

namespace relay {
    enum class log_level : std::uint8_t {
        none  = RELAY_LOG_LEVEL_NONE,
        error = RELAY_LOG_LEVEL_ERROR,
        warn  = RELAY_LOG_LEVEL_WARN,
        info  = RELAY_LOG_LEVEL_INFO,
        debug = RELAY_LOG_LEVEL_DEBUG,
        trace = RELAY_LOG_LEVEL_TRACE,
    };

    namespace log_tags {
        inline constexpr std::string_view signal   = "signal";
        inline constexpr std::string_view queue    = "queue";
        inline constexpr std::string_view worker   = "worker";
        inline constexpr std::string_view pool     = "pool";
        inline constexpr std::string_view progress = "progress";
    }

    inline constexpr char level_char(log_level level) noexcept {
        switch (level) {
            case log_level::error: return 'E';
            case log_level::warn:  return 'W';
            case log_level::info:  return 'I';
            case log_level::debug: return 'D';
            case log_level::trace: return 'T';
            default:               return '-';
        }
    }

    inline std::optional<log_level> parse_log_level(std::string_view text) {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "none")  return log_level::none;
        if (lowered == "error") return log_level::error;
        if (lowered == "warn" || lowered == "warning") return log_level::warn;
        if (lowered == "info")  return log_level::info;
        if (lowered == "debug") return log_level::debug;
        if (lowered == "trace") return log_level::trace;
        return std::nullopt;
    }

    struct log_sink {
        virtual ~log_sink() = default;
        virtual void write(log_level level, std::string_view tag, std::string_view line) = 0;
    };

    // Writes "[relay][W][tag][thread] message" lines to an ostream.
    struct ostream_sink : log_sink {
        explicit ostream_sink(std::ostream& os) : os_(os) {}

        void write(log_level level, std::string_view tag, std::string_view line) override {
            std::lock_guard lock(mutex_);
            os_ << "[relay][" << level_char(level) << "][" << tag << "]["
                << std::this_thread::get_id() << "] " << line << '\n';
        }

    private:
        std::ostream& os_;
        std::mutex    mutex_;
    };

    class logger {
    public:
        static void set_level(log_level level) noexcept {
            State().level_.store(level, std::memory_order_relaxed);
        }

        static log_level level() noexcept {
            return State().level_.load(std::memory_order_relaxed);
        }

        static bool should_log(log_level level) noexcept {
            auto current = State().level_.load(std::memory_order_relaxed);
            return level != log_level::none &&
                static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(current);
        }

        static void add_sink(std::shared_ptr<log_sink> sink) {
            auto& state = State();
            std::lock_guard lock(state.mutex_);
            state.sinks_.push_back(std::move(sink));
        }

        static bool remove_sink(const std::shared_ptr<log_sink>& sink) {
            auto& state = State();
            std::lock_guard lock(state.mutex_);
            auto it = std::find(state.sinks_.begin(), state.sinks_.end(), sink);
            if (it == state.sinks_.end()) {
                return false;
            }
            state.sinks_.erase(it);
            return true;
        }

        // Removes every sink, the default std::clog sink included.
        static void clear_sinks() {
            auto& state = State();
            std::lock_guard lock(state.mutex_);
            state.sinks_.clear();
        }

        template <typename... Parts>
        static void log(log_level level, std::string_view tag, const Parts&... parts) {
            if (!should_log(level)) {
                return;
            }
            std::ostringstream line;
            (line << ... << parts);
            Dispatch(level, tag, line.str());
        }

    private:
        struct state {
            state() : level_(Initial_level()) {
                sinks_.push_back(std::make_shared<ostream_sink>(std::clog));
            }

            static log_level Initial_level() {
                if (auto value = detail::env_value("RELAY_LOG_LEVEL")) {
                    if (auto parsed = parse_log_level(*value)) {
                        return *parsed;
                    }
                }
                return log_level::warn;
            }

            std::atomic<log_level>                 level_;
            std::mutex                             mutex_;
            std::vector<std::shared_ptr<log_sink>> sinks_;
        };

        static state& State() {
            static state instance;
            return instance;
        }

        static void Dispatch(log_level level, std::string_view tag, const std::string& line) {
            std::vector<std::shared_ptr<log_sink>> sinks;
            {
                auto& state = State();
                std::lock_guard lock(state.mutex_);
                sinks = state.sinks_;
            }
            for (auto& sink : sinks) {
                sink->write(level, tag, line);
            }
        }
    };
}

#if RELAY_LOG_BUILD_LEVEL >= RELAY_LOG_LEVEL_ERROR
#define RELAY_LOG_ERROR(TAG, ...) ::relay::logger::log(::relay::log_level::error, TAG, __VA_ARGS__)
#else
#define RELAY_LOG_ERROR(...) do {} while (0)
#endif

#if RELAY_LOG_BUILD_LEVEL >= RELAY_LOG_LEVEL_WARN
#define RELAY_LOG_WARN(TAG, ...) ::relay::logger::log(::relay::log_level::warn, TAG, __VA_ARGS__)
#else
#define RELAY_LOG_WARN(...) do {} while (0)
#endif

#if RELAY_LOG_BUILD_LEVEL >= RELAY_LOG_LEVEL_INFO
#define RELAY_LOG_INFO(TAG, ...) ::relay::logger::log(::relay::log_level::info, TAG, __VA_ARGS__)
#else
#define RELAY_LOG_INFO(...) do {} while (0)
#endif

#if RELAY_LOG_BUILD_LEVEL >= RELAY_LOG_LEVEL_DEBUG
#define RELAY_LOG_DEBUG(TAG, ...) ::relay::logger::log(::relay::log_level::debug, TAG, __VA_ARGS__)
#else
#define RELAY_LOG_DEBUG(...) do {} while (0)
#endif

#if RELAY_LOG_BUILD_LEVEL >= RELAY_LOG_LEVEL_TRACE
#define RELAY_LOG_TRACE(TAG, ...) ::relay::logger::log(::relay::log_level::trace, TAG, __VA_ARGS__)
#else
#define RELAY_LOG_TRACE(...) do {} while (0)
#endif

#endif // !RELAY_LOG_HPP

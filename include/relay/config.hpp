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

#ifndef RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP

#ifndef RELAY_ALWAYS_INLINE
#   if defined(_MSC_VER)
#       define RELAY_ALWAYS_INLINE [[msvc::forceinline]]
#   else
#       define RELAY_ALWAYS_INLINE [[gnu::always_inline]]
#   endif
#endif // !RELAY_ALWAYS_INLINE

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <charconv>
#include <algorithm>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace relay {
    namespace detail {
        inline std::optional<std::string> env_value(const char* name) {
            const char* value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        }

        inline std::optional<std::size_t> parse_count(std::string_view text) {
            std::size_t value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                return std::nullopt;
            }
            return value;
        }
    }

    // num_threads == 0 selects std::thread::hardware_concurrency().
    struct thread_pool_config {
        // The pool takes a 32-bit thread count.
        static constexpr std::size_t max_threads = std::numeric_limits<std::uint32_t>::max();

        std::size_t num_threads = 0;
        std::string name        = "relay-pool";

        static thread_pool_config with_threads(std::size_t num_threads) {
            thread_pool_config config;
            config.num_threads = num_threads;
            return config;
        }

        // Reads RELAY_POOL_THREADS; malformed or out of range values are ignored.
        static thread_pool_config from_environment() {
            thread_pool_config config;
            if (auto value = detail::env_value("RELAY_POOL_THREADS")) {
                if (auto count = detail::parse_count(*value); count && *count <= max_threads) {
                    config.num_threads = *count;
                }
            }
            return config;
        }

        std::size_t resolved_threads() const noexcept {
            if (num_threads != 0) {
                return std::min(num_threads, max_threads);
            }
            unsigned hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 1 : hardware;
        }
    };

    struct worker_config {
        static constexpr std::size_t default_queue_capacity = 256;

        std::string name           = "relay-worker";
        std::size_t queue_capacity = default_queue_capacity;

        static worker_config with_name(std::string name) {
            worker_config config;
            config.name = std::move(name);
            return config;
        }
    };
}

#endif // !RELAY_CONFIG_HPP

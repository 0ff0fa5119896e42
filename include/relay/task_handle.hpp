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

#ifndef RELAY_TASK_HANDLE_HPP
#define RELAY_TASK_HANDLE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "cancellation.hpp"
#include "error.hpp"
#include "log.hpp"

namespace relay {
    namespace detail {
        // void results are carried as std::monostate.
        template <typename F, typename... Args>
        using task_result_t = std::conditional_t<
            std::is_void_v<std::invoke_result_t<F, Args...>>,
            std::monostate,
            std::invoke_result_t<F, Args...>>;

        template <typename T>
        struct task_state {
            void Set_value(T&& value) {
                {
                    std::lock_guard lock(mutex_);
                    if (finished_) {
                        return;
                    }
                    value_.emplace(std::move(value));
                    finished_ = true;
                }
                cv_.notify_all();
            }

            void Set_error(std::exception_ptr error) {
                {
                    std::lock_guard lock(mutex_);
                    if (finished_) {
                        return;
                    }
                    error_    = std::move(error);
                    finished_ = true;
                }
                cv_.notify_all();
            }

            void Abandon() {
                {
                    std::lock_guard lock(mutex_);
                    if (finished_) {
                        return;
                    }
                    finished_ = true;
                }
                cv_.notify_all();
            }

            std::mutex              mutex_;
            std::condition_variable cv_;
            std::optional<T>        value_;
            std::exception_ptr      error_;
            bool                    finished_ = false;
        };

        inline std::uint64_t next_task_id() noexcept {
            static std::atomic<std::uint64_t> next{1};
            return next.fetch_add(1, std::memory_order_relaxed);
        }

        // Producer side of a task_handle. Destroying it before Run leaves the
        // handle empty instead of blocking its waiters forever.
        template <typename T>
        class task_promise {
        public:
            task_promise(std::shared_ptr<task_state<T>> state, std::string_view tag)
                : state_(std::move(state)), tag_(tag) {}

            ~task_promise() {
                if (state_) {
                    state_->Abandon();
                }
            }

            task_promise(const task_promise&)            = delete;
            task_promise& operator=(const task_promise&) = delete;

            task_promise(task_promise&& other) noexcept
                : state_(std::move(other.state_)), tag_(other.tag_) {}

            task_promise& operator=(task_promise&& other) noexcept {
                if (this != &other) {
                    if (state_) {
                        state_->Abandon();
                    }
                    state_ = std::move(other.state_);
                    tag_   = other.tag_;
                }
                return *this;
            }

            // Invokes fn and records its value, or the exception it threw.
            template <typename F, typename... Args>
            void Run(F& fn, Args&&... args) {
                auto state = std::move(state_);
                try {
                    if constexpr (std::is_void_v<std::invoke_result_t<F&, Args...>>) {
                        std::invoke(fn, std::forward<Args>(args)...);
                        state->Set_value(std::monostate{});
                    }
                    else {
                        state->Set_value(std::invoke(fn, std::forward<Args>(args)...));
                    }
                }
                catch (...) {
                    auto error = std::current_exception();
                    RELAY_LOG_ERROR(tag_, "task threw: ", describe(error));
                    state->Set_error(std::move(error));
                }
            }

        private:
            std::shared_ptr<task_state<T>> state_;
            std::string_view               tag_;
        };
    }

    // Completion cell of a spawned task. The value can be taken once: after
    // wait() or a successful try_get() returned it, later calls return empty.
    template <typename T>
    class task_handle {
    public:
        task_handle(std::uint64_t id, std::shared_ptr<detail::task_state<T>> state,
            std::optional<cancellation_token> token = std::nullopt)
            : id_(id), state_(std::move(state)), token_(std::move(token)) {}

        std::uint64_t id() const noexcept {
            return id_;
        }

        bool is_finished() const {
            std::lock_guard lock(state_->mutex_);
            return state_->finished_;
        }

        std::optional<T> try_get() {
            std::lock_guard lock(state_->mutex_);
            return Take();
        }

        // Blocks until the task finished. Empty if it threw or never ran.
        std::optional<T> wait() {
            std::unique_lock lock(state_->mutex_);
            state_->cv_.wait(lock, [this] { return state_->finished_; });
            return Take();
        }

        template <typename Rep, typename Period>
        std::optional<T> wait_for(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock lock(state_->mutex_);
            if (!state_->cv_.wait_for(lock, timeout, [this] { return state_->finished_; })) {
                return std::nullopt;
            }
            return Take();
        }

        std::exception_ptr error() const {
            std::lock_guard lock(state_->mutex_);
            return state_->error_;
        }

        // No-op for tasks spawned without a token.
        void cancel() const noexcept {
            if (token_) {
                token_->cancel();
            }
        }

        const std::optional<cancellation_token>& cancellation() const noexcept {
            return token_;
        }

    private:
        std::optional<T> Take() {
            std::optional<T> result = std::move(state_->value_);
            state_->value_.reset();
            return result;
        }

        std::uint64_t                          id_;
        std::shared_ptr<detail::task_state<T>> state_;
        std::optional<cancellation_token>      token_;
    };

    namespace detail {
        template <typename T>
        std::pair<task_handle<T>, task_promise<T>> make_task(std::string_view tag,
            std::optional<cancellation_token> token = std::nullopt) {
            auto state = std::make_shared<task_state<T>>();
            return {task_handle<T>(next_task_id(), state, std::move(token)), task_promise<T>(state, tag)};
        }
    }
}

#endif // !RELAY_TASK_HANDLE_HPP

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

#ifndef RELAY_THREAD_POOL_HPP
#define RELAY_THREAD_POOL_HPP

#include <stdexec/execution.hpp>
#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>

#include "cancellation.hpp"
#include "config.hpp"
#include "dispatch_queue.hpp"
#include "error.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "task_handle.hpp"
#include "thread_role.hpp"

namespace relay {
    class thread_pool;

    namespace detail {
        // Pool whose task the calling thread is running, if any.
        inline thread_local const thread_pool* current_pool = nullptr;

        struct current_pool_scope {
            explicit current_pool_scope(const thread_pool* pool) noexcept
                : previous_(std::exchange(current_pool, pool)) {}
            ~current_pool_scope() {
                current_pool = previous_;
            }

            const thread_pool* previous_;
        };

        // Counts a submitted task until whatever holds it is destroyed, so a
        // task dropped by a stopped scope still leaves the count.
        struct active_task_guard {
            explicit active_task_guard(std::atomic<std::size_t>& counter) noexcept : counter_(&counter) {
                counter_->fetch_add(1, std::memory_order_acq_rel);
            }
            ~active_task_guard() {
                if (counter_) {
                    counter_->fetch_sub(1, std::memory_order_acq_rel);
                }
            }

            active_task_guard(active_task_guard&& other) noexcept
                : counter_(std::exchange(other.counter_, nullptr)) {}
            active_task_guard(const active_task_guard&)            = delete;
            active_task_guard& operator=(const active_task_guard&) = delete;
            active_task_guard& operator=(active_task_guard&&)      = delete;

            std::atomic<std::size_t>* counter_;
        };
    }

    // Fixed set of threads running spawned tasks. Every task is nested in an
    // async scope; destruction waits for the scope to empty, so tasks spawned
    // before destruction all run.
    class thread_pool {
    public:
        explicit thread_pool(thread_pool_config config = {})
            : config_(std::move(config)),
              pool_(static_cast<std::uint32_t>(config_.resolved_threads())) {
            RELAY_LOG_DEBUG(log_tags::pool, "pool '", config_.name, "' started with ",
                pool_.available_parallelism(), " thread(s)");
        }

        ~thread_pool() {
            stdexec::sync_wait(scope_.on_empty());
            RELAY_LOG_DEBUG(log_tags::pool, "pool '", config_.name, "' drained");
        }

        thread_pool(const thread_pool&)            = delete;
        thread_pool& operator=(const thread_pool&) = delete;

        // Constructed on first use from thread_pool_config::from_environment().
        // References stay valid until shutdown_global().
        static thread_pool& global() {
            auto& global = Global();
            std::lock_guard lock(global.mutex_);
            if (!global.pool_) {
                Install(global, thread_pool_config::from_environment());
            }
            return *global.pool_;
        }

        static thread_pool& init_global(thread_pool_config config) {
            auto& global = Global();
            std::lock_guard lock(global.mutex_);
            if (global.pool_) {
                throw pool_error("Can't initialize global thread pool: it is already initialized.");
            }
            Install(global, std::move(config));
            return *global.pool_;
        }

        // Drains and destroys the global pool; a later global() builds a new one.
        static bool shutdown_global() {
            std::unique_ptr<thread_pool> pool;
            {
                auto& global = Global();
                std::lock_guard lock(global.mutex_);
                pool = std::move(global.pool_);
            }
            return pool != nullptr;
        }

        std::size_t num_threads() const noexcept {
            return pool_.available_parallelism();
        }

        std::size_t active_tasks() const noexcept {
            return active_.load(std::memory_order_acquire);
        }

        const thread_pool_config& config() const noexcept {
            return config_;
        }

        template <typename F>
            requires std::invocable<std::decay_t<F>&>
        auto spawn(F&& task) -> task_handle<detail::task_result_t<std::decay_t<F>&>> {
            using result_t = detail::task_result_t<std::decay_t<F>&>;
            auto [handle, promise] = detail::make_task<result_t>(log_tags::pool);
            Submit([task = std::forward<F>(task), promise = std::move(promise)]() mutable {
                promise.Run(task);
            });
            return std::move(handle);
        }

        // The token is shared with the task, which is expected to poll it.
        template <typename F>
            requires std::invocable<std::decay_t<F>&, cancellation_token&>
        auto spawn_cancellable(F&& task)
            -> std::pair<task_handle<detail::task_result_t<std::decay_t<F>&, cancellation_token&>>, cancellation_token> {
            using result_t = detail::task_result_t<std::decay_t<F>&, cancellation_token&>;
            cancellation_token token;
            auto [handle, promise] = detail::make_task<result_t>(log_tags::pool, token);
            Submit([task = std::forward<F>(task), token, promise = std::move(promise)]() mutable {
                promise.Run(task, token);
            });
            return {std::move(handle), token};
        }

        // callback(result) is queued to the spawning thread. A task that throws
        // is logged and its callback never runs.
        template <typename F, typename C>
            requires std::invocable<std::decay_t<F>&>
        void spawn_with_callback(F&& task, C&& callback) {
            using raw_t = std::invoke_result_t<std::decay_t<F>&>;
            auto spawner = detail::destination::bind(std::this_thread::get_id());
            Submit([spawner = std::move(spawner), task = std::forward<F>(task), callback = std::forward<C>(callback)]() mutable {
                try {
                    if constexpr (std::is_void_v<raw_t>) {
                        std::invoke(task);
                        detail::deliver(spawner, make_invocation(std::move(callback)));
                    }
                    else {
                        detail::deliver(spawner, make_invocation(
                            [callback = std::move(callback), result = std::invoke(task)]() mutable {
                                std::invoke(callback, std::move(result));
                            }));
                    }
                }
                catch (...) {
                    RELAY_LOG_ERROR(log_tags::pool, "task threw, callback skipped: ",
                        detail::describe(std::current_exception()));
                }
            });
        }

        template <typename F>
            requires std::invocable<std::decay_t<F>&, cancellation_token&, progress_reporter&>
        auto spawn_with_progress(F&& task)
            -> std::tuple<task_handle<detail::task_result_t<std::decay_t<F>&, cancellation_token&, progress_reporter&>>,
                          cancellation_token, progress_reporter> {
            using result_t = detail::task_result_t<std::decay_t<F>&, cancellation_token&, progress_reporter&>;
            cancellation_token token;
            progress_reporter  reporter;
            auto [handle, promise] = detail::make_task<result_t>(log_tags::pool, token);
            Submit([task = std::forward<F>(task), token, reporter, promise = std::move(promise)]() mutable {
                promise.Run(task, token, reporter);
            });
            return {std::move(handle), token, reporter};
        }

        // Runs task on the pool and blocks for its result, rethrowing what it
        // threw. Called from one of this pool's tasks, it runs inline.
        template <typename F>
            requires std::invocable<std::decay_t<F>&>
        auto execute(F&& task) -> std::invoke_result_t<std::decay_t<F>&> {
            using raw_t = std::invoke_result_t<std::decay_t<F>&>;
            if (detail::current_pool == this) {
                return std::invoke(task);
            }
            auto handle = spawn(std::forward<F>(task));
            auto value  = handle.wait();
            if (!value) {
                if (auto error = handle.error()) {
                    std::rethrow_exception(error);
                }
                throw pool_error("Can't execute task: it was dropped before running.");
            }
            if constexpr (std::is_void_v<raw_t>) {
                return;
            }
            else {
                return std::move(*value);
            }
        }

    private:
        struct global_state {
            std::mutex                   mutex_;
            std::unique_ptr<thread_pool> pool_;
            bool                         exit_hook_ = false;
        };

        static global_state& Global() {
            static global_state global;
            return global;
        }

        static void Exit_hook() {
            shutdown_global();
        }

        static void Install(global_state& global, thread_pool_config config) {
            global.pool_ = std::make_unique<thread_pool>(std::move(config));
            if (!global.exit_hook_) {
                // Statics used while draining must be constructed before the
                // hook is registered so they are destroyed after it runs.
                logger::level();
                detail::dispatch_registry::instance();
                detail::thread_role_registry::instance();
                std::atexit(&thread_pool::Exit_hook);
                global.exit_hook_ = true;
            }
        }

        template <typename Body>
        void Submit(Body&& body) {
            scope_.spawn(
                stdexec::schedule(pool_.get_scheduler())
                | stdexec::then([this, guard = detail::active_task_guard(active_), body = std::forward<Body>(body)]() mutable noexcept {
                    detail::current_pool_scope scope(this);
                    body();
                }));
        }

        thread_pool_config               config_;
        std::atomic<std::size_t>         active_ = 0;
        exec::static_thread_pool         pool_;
        exec::async_scope                scope_;
    };
}

#endif // !RELAY_THREAD_POOL_HPP

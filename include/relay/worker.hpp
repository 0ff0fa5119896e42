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

#ifndef RELAY_WORKER_HPP
#define RELAY_WORKER_HPP

#include <atomic>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#if defined(__linux__)
#include <pthread.h>
#endif

#include "cancellation.hpp"
#include "config.hpp"
#include "dispatch_queue.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "signal.hpp"
#include "task_handle.hpp"
#include "thread_role.hpp"

namespace relay {
    namespace detail {
        inline void name_current_thread(const std::string& name) {
#if defined(__linux__)
            // Linux limits thread names to 15 characters.
            pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#else
            (void)name;
#endif
        }
    }

    // One dedicated thread executing submitted tasks strictly one at a time,
    // in submission order. The thread's dispatch queue doubles as the task
    // queue, so connections may also name the worker thread as their
    // required thread.
    template <detail::signal_arg T>
    class worker {
    public:
        worker() : worker(worker_config{}) {}

        explicit worker(worker_config config)
            : config_(std::move(config)),
              queue_(std::make_shared<dispatch_queue>()),
              pending_(std::make_shared<std::atomic<std::size_t>>(0)),
              results_(std::make_shared<signal<T>>()) {
            thread_ = std::thread([queue = queue_, name = config_.name] { Run(queue, name); });
            thread_id_.store(thread_.get_id(), std::memory_order_release);
            detail::dispatch_registry::instance().Attach(thread_.get_id(), queue_);
            RELAY_LOG_DEBUG(log_tags::worker, "worker '", config_.name, "' started");
        }

        // Destroying the worker from one of its own tasks can't join. The
        // remaining tasks are discarded and the thread finishes detached.
        ~worker() {
            if (std::this_thread::get_id() != thread_id()) {
                stop_and_join();
                return;
            }
            RELAY_LOG_WARN(log_tags::worker, "worker '", config_.name,
                "' destroyed from its own thread, detaching");
            running_.store(false, std::memory_order_release);
            cancellation_.cancel();
            queue_->shutdown();
            std::lock_guard lock(join_mutex_);
            if (thread_.joinable()) {
                thread_.detach();
            }
        }

        worker(const worker&)            = delete;
        worker& operator=(const worker&) = delete;

        // Never blocks. False once stopped or when queue_capacity tasks are pending.
        template <typename F>
            requires std::convertible_to<std::invoke_result_t<std::decay_t<F>&>, T>
        bool send(F&& task) {
            return Submit([results = results_, task = std::forward<F>(task)]() mutable {
                results->emit(T(task()));
            });
        }

        // callback(result) is queued to the thread calling send_with_callback.
        template <typename F, typename C>
            requires std::convertible_to<std::invoke_result_t<std::decay_t<F>&>, T>
                && std::invocable<std::decay_t<C>&, T>
        bool send_with_callback(F&& task, C&& callback) {
            auto caller = detail::destination::bind(std::this_thread::get_id());
            return Submit([caller = std::move(caller), task = std::forward<F>(task), callback = std::forward<C>(callback)]() mutable {
                detail::deliver(caller, make_invocation(
                    [callback = std::move(callback), result = T(task())]() mutable {
                        std::invoke(callback, std::move(result));
                    }));
            });
        }

        // Blocks for the result. Runs inline on the worker's own thread.
        template <typename F>
            requires std::convertible_to<std::invoke_result_t<std::decay_t<F>&>, T>
        std::optional<T> send_sync(F&& task) {
            auto body = [task = std::forward<F>(task)]() mutable -> T { return T(task()); };
            auto [handle, promise] = detail::make_task<T>(log_tags::worker);
            if (std::this_thread::get_id() == thread_id()) {
                promise.Run(body);
                return handle.wait();
            }
            if (!Submit([body = std::move(body), promise = std::move(promise)]() mutable { promise.Run(body); })) {
                return std::nullopt;
            }
            return handle.wait();
        }

        template <typename F>
            requires std::convertible_to<std::invoke_result_t<std::decay_t<F>&, progress_reporter&>, T>
        std::optional<progress_reporter> send_with_progress(F&& task) {
            progress_reporter reporter;
            bool accepted = send([reporter, task = std::forward<F>(task)]() mutable { return task(reporter); });
            if (!accepted) {
                return std::nullopt;
            }
            return reporter;
        }

        // Results of send(). Slots connected from the creator thread with the
        // default connection type receive them queued on that thread.
        signal<T>& on_result() noexcept {
            return *results_;
        }

        // Stops accepting tasks; the queue drains before the thread exits.
        void stop() {
            if (running_.exchange(false, std::memory_order_acq_rel)) {
                RELAY_LOG_DEBUG(log_tags::worker, "worker '", config_.name, "' stopping with ",
                    pending_->load(std::memory_order_acquire), " pending task(s)");
            }
            cancellation_.cancel();
            queue_->close();
        }

        // False when already joined, or when called on the worker thread itself.
        bool join() {
            std::lock_guard lock(join_mutex_);
            if (!thread_.joinable()) {
                return false;
            }
            if (thread_.get_id() == std::this_thread::get_id()) {
                RELAY_LOG_WARN(log_tags::worker, "worker '", config_.name, "' can't join itself");
                return false;
            }
            thread_.join();
            return true;
        }

        bool stop_and_join() {
            stop();
            return join();
        }

        bool is_running() const noexcept {
            return running_.load(std::memory_order_acquire);
        }

        std::size_t pending_tasks() const noexcept {
            return pending_->load(std::memory_order_acquire);
        }

        // Cancelled by stop(); long tasks may poll it to bail out early.
        const cancellation_token& get_cancellation_token() const noexcept {
            return cancellation_;
        }

        std::thread::id thread_id() const noexcept {
            return thread_id_.load(std::memory_order_acquire);
        }

        const worker_config& config() const noexcept {
            return config_;
        }

    private:
        struct pending_guard {
            std::shared_ptr<std::atomic<std::size_t>> pending_;
            ~pending_guard() {
                pending_->fetch_sub(1, std::memory_order_acq_rel);
            }
        };

        // Touches nothing of the worker object, which may be gone already.
        static void Run(std::shared_ptr<dispatch_queue> queue, std::string name) {
            detail::name_current_thread(name);
            queue->run();
            detail::dispatch_registry::instance().Retire(std::this_thread::get_id());
            RELAY_LOG_DEBUG(log_tags::worker, "worker '", name, "' exited");
        }

        template <typename Body>
        bool Submit(Body&& body) {
            if (!is_running()) {
                return false;
            }
            if (pending_->fetch_add(1, std::memory_order_acq_rel) >= config_.queue_capacity) {
                pending_->fetch_sub(1, std::memory_order_acq_rel);
                RELAY_LOG_WARN(log_tags::worker, "worker '", config_.name, "' queue is full");
                return false;
            }
            bool posted = queue_->post(make_invocation(
                [pending = pending_, body = std::forward<Body>(body)]() mutable {
                    pending_guard guard{pending};
                    body();
                }));
            if (!posted) {
                pending_->fetch_sub(1, std::memory_order_acq_rel);
            }
            return posted;
        }

        worker_config                   config_;
        std::shared_ptr<dispatch_queue> queue_;
        std::atomic_bool                running_ = true;
        std::shared_ptr<std::atomic<std::size_t>> pending_;
        std::shared_ptr<signal<T>>      results_;
        std::atomic<std::thread::id>    thread_id_;
        cancellation_token              cancellation_;
        std::mutex                      join_mutex_;
        std::thread                     thread_;
    };

    class worker_builder {
    public:
        worker_builder& name(std::string value) {
            config_.name = std::move(value);
            return *this;
        }

        worker_builder& queue_capacity(std::size_t value) {
            config_.queue_capacity = value;
            return *this;
        }

        const worker_config& config() const noexcept {
            return config_;
        }

        template <detail::signal_arg T>
        std::unique_ptr<worker<T>> build() const {
            return std::make_unique<worker<T>>(config_);
        }

    private:
        worker_config config_;
    };
}

#endif // !RELAY_WORKER_HPP

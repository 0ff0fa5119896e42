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

#ifndef RELAY_THREAD_ROLE_HPP
#define RELAY_THREAD_ROLE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

#include "dispatch_queue.hpp"
#include "error.hpp"
#include "log.hpp"

namespace relay {
    namespace detail {
        struct thread_role_registry {
            static thread_role_registry& instance() {
                static thread_role_registry registry;
                return registry;
            }

            // Written once under mutex_, published by designated_.
            std::mutex        mutex_;
            std::atomic_bool  designated_ = false;
            std::thread::id   owner_;
        };

        inline std::string thread_name(std::thread::id id) {
            std::ostringstream os;
            os << id;
            return os.str();
        }
    }

    // Designates the calling thread as owner thread and attaches its dispatch
    // queue. Repeating the call on the same thread is a no-op.
    inline void set_owner_thread() {
        auto& registry = detail::thread_role_registry::instance();
        const auto current = std::this_thread::get_id();
        {
            std::lock_guard lock(registry.mutex_);
            if (registry.designated_.load(std::memory_order_acquire)) {
                if (registry.owner_ != current) {
                    throw thread_role_error("Can't designate owner thread: thread " +
                        detail::thread_name(registry.owner_) + " is already the owner thread.");
                }
                return;
            }
            registry.owner_ = current;
            registry.designated_.store(true, std::memory_order_release);
        }
        dispatch_queue::attach_current();
        RELAY_LOG_DEBUG(log_tags::queue, "owner thread designated");
    }

    inline std::optional<std::thread::id> owner_thread_id() noexcept {
        auto& registry = detail::thread_role_registry::instance();
        if (!registry.designated_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        return registry.owner_;
    }

    // True on the owner thread, and on every thread before one is designated.
    inline bool is_owner_thread() noexcept {
        auto owner = owner_thread_id();
        return !owner || *owner == std::this_thread::get_id();
    }

    inline std::optional<std::thread::id> main_thread_id() noexcept {
        return owner_thread_id();
    }

    inline bool is_main_thread() noexcept {
        return is_owner_thread();
    }

    inline void check_owner_thread(std::string_view what) {
        if (!is_owner_thread()) {
            throw thread_role_error("Can't run " + std::string(what) +
                ": it must run on the owner thread, not on thread " +
                detail::thread_name(std::this_thread::get_id()) + ".");
        }
    }

    class thread_affinity {
    public:
        thread_affinity() : id_(std::this_thread::get_id()) {}
        explicit thread_affinity(std::thread::id id) : id_(id) {}

        static thread_affinity current() {
            return thread_affinity{};
        }

        // Falls back to the calling thread while no owner is designated.
        static thread_affinity owner() {
            return thread_affinity(owner_thread_id().value_or(std::this_thread::get_id()));
        }

        std::thread::id thread_id() const noexcept {
            return id_;
        }

        bool is_same_thread() const noexcept {
            return std::this_thread::get_id() == id_;
        }

        bool is_owner_thread_affinity() const noexcept {
            return owner_thread_id() == id_;
        }

        void check_same_thread(std::string_view what) const {
            if (!is_same_thread()) {
                throw thread_role_error("Can't access " + std::string(what) +
                    ": it belongs to thread " + detail::thread_name(id_) +
                    " but was used from thread " + detail::thread_name(std::this_thread::get_id()) + ".");
            }
        }

        friend bool operator==(const thread_affinity&, const thread_affinity&) = default;

    private:
        std::thread::id id_;
    };

    // Drain entry point for the run loop: executes what is queued for the
    // calling thread right now.
    inline std::size_t process_deferred() {
        auto queue = dispatch_queue::current();
        return queue ? queue->drain() : 0;
    }

    template <typename Rep, typename Period>
    std::size_t wait_deferred(std::chrono::duration<Rep, Period> timeout) {
        auto queue = dispatch_queue::current();
        return queue ? queue->wait_and_drain(timeout) : 0;
    }

    namespace detail {
        enum class delivery { queued, executed_inline, rejected };

        // Destination is `target`, or the owner thread when no affinity is given.
        inline std::optional<std::thread::id> resolve_destination(std::optional<std::thread::id> target) noexcept {
            return target ? target : owner_thread_id();
        }

        // Where a connection or callback delivers to. A thread that has a queue
        // when the destination is made is bound to that queue, so its deliveries
        // fail once the queue is gone, whatever thread reuses the id later.
        struct destination {
            static destination bind(std::optional<std::thread::id> thread) {
                destination target;
                target.thread_ = thread;
                if (thread) {
                    if (auto queue = dispatch_queue::find(*thread)) {
                        target.queue_ = queue;
                        target.bound_ = true;
                    }
                }
                return target;
            }

            std::optional<std::thread::id> thread_;
            std::weak_ptr<dispatch_queue>  queue_;
            bool                           bound_ = false;
        };

        inline delivery deliver(const destination& target, invocation item) {
            std::shared_ptr<dispatch_queue> queue;
            std::optional<std::thread::id> thread;
            if (target.bound_) {
                thread = target.thread_;
                queue  = target.queue_.lock();
                if (!queue) {
                    RELAY_LOG_WARN(log_tags::queue, "dispatch queue of thread ", *thread,
                        " is gone, dropping delivery");
                    return delivery::rejected;
                }
            }
            else {
                thread = resolve_destination(target.thread_);
                if (!thread) {
                    execute(item);
                    return delivery::executed_inline;
                }
                queue = dispatch_queue::find(*thread);
                if (!queue) {
                    RELAY_LOG_WARN(log_tags::queue, "no dispatch queue attached to thread ",
                        *thread, ", executing on the emitting thread");
                    execute(item);
                    return delivery::executed_inline;
                }
            }

            if (!queue->post(std::move(item))) {
                RELAY_LOG_WARN(log_tags::queue, "dispatch queue of thread ", *thread,
                    " is closed, dropping delivery");
                return delivery::rejected;
            }
            return delivery::queued;
        }
    }
}

#endif // !RELAY_THREAD_ROLE_HPP

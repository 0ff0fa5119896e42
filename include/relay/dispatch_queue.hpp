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

#ifndef RELAY_DISPATCH_QUEUE_HPP
#define RELAY_DISPATCH_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"

namespace relay {
    namespace detail {
        // Completion cell shared between a blocking emitter and the queued item.
        struct completion_state {
            enum class status { pending, done, abandoned };

            void Finish(status result) {
                {
                    std::lock_guard lock(mutex_);
                    if (status_ != status::pending) {
                        return;
                    }
                    status_ = result;
                }
                cv_.notify_all();
            }

            status Wait() {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this] { return status_ != status::pending; });
                return status_;
            }

        private:
            std::mutex              mutex_;
            std::condition_variable cv_;
            status                  status_ = status::pending;
        };

        struct invocation_base {
            invocation_base()          = default;
            virtual ~invocation_base() {
                // Dropped without running: release anyone blocked on it.
                if (completion_) {
                    completion_->Finish(completion_state::status::abandoned);
                }
            }

            invocation_base(const invocation_base&)            = delete;
            invocation_base& operator=(const invocation_base&) = delete;

            virtual void Invoke() = 0;

            std::shared_ptr<completion_state> completion_;
        };

        template <typename F>
        struct invocation_impl : invocation_base {
            template <typename U>
            explicit invocation_impl(U&& fn) : fn_(std::forward<U>(fn)) {}

            void Invoke() override {
                fn_();
            }

            F fn_;
        };
    }

    using invocation = std::unique_ptr<detail::invocation_base>;

    template <typename F>
        requires std::invocable<std::decay_t<F>&>
    invocation make_invocation(F&& fn) {
        return std::make_unique<detail::invocation_impl<std::decay_t<F>>>(std::forward<F>(fn));
    }

    namespace detail {
        // Runs one item. A throwing item is logged and still counts as delivered.
        inline void execute(invocation& item) {
            try {
                item->Invoke();
            }
            catch (...) {
                RELAY_LOG_ERROR(log_tags::queue, "queued invocation threw: ", describe(std::current_exception()));
            }
            if (item->completion_) {
                item->completion_->Finish(completion_state::status::done);
            }
        }
    }

    // FIFO of deferred invocations drained by exactly one thread at a time.
    class dispatch_queue {
    public:
        dispatch_queue()  = default;
        ~dispatch_queue() = default;

        dispatch_queue(const dispatch_queue&)            = delete;
        dispatch_queue& operator=(const dispatch_queue&) = delete;

        // Returns false once the queue is closed; the rejected item is
        // destroyed, which abandons its completion cell.
        bool post(invocation item) {
            {
                std::lock_guard lock(mutex_);
                if (closed_) {
                    return false;
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        // Executes the items queued at the time of the call. Items posted
        // while draining wait for the next drain.
        std::size_t drain() {
            std::deque<invocation> batch;
            {
                std::lock_guard lock(mutex_);
                batch.swap(items_);
            }
            return Execute(batch);
        }

        template <typename Rep, typename Period>
        std::size_t wait_and_drain(std::chrono::duration<Rep, Period> timeout) {
            {
                std::unique_lock lock(mutex_);
                if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; })) {
                    return 0;
                }
            }
            return drain();
        }

        // Drains until the queue is closed and empty.
        void run() {
            for (;;) {
                std::deque<invocation> batch;
                {
                    std::unique_lock lock(mutex_);
                    cv_.wait(lock, [this] { return !items_.empty() || closed_; });
                    if (items_.empty()) {
                        return;
                    }
                    batch.swap(items_);
                }
                Execute(batch);
            }
        }

        // Stops accepting items. Already queued items still run on the next drain.
        void close() {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        // close() and discard everything still queued, including the rest of
        // a batch that is being drained.
        std::size_t shutdown() {
            std::deque<invocation> discarded;
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
                discarded_.store(true, std::memory_order_release);
                discarded.swap(items_);
            }
            cv_.notify_all();
            if (!discarded.empty()) {
                RELAY_LOG_WARN(log_tags::queue, "discarding ", discarded.size(), " undelivered invocation(s)");
            }
            return discarded.size();
        }

        std::size_t pending() const {
            std::lock_guard lock(mutex_);
            return items_.size();
        }

        bool is_closed() const {
            std::lock_guard lock(mutex_);
            return closed_;
        }

        // Queue attached to the calling thread, created on first use.
        static std::shared_ptr<dispatch_queue> attach_current();

        // Shuts down and unregisters the calling thread's queue. Connections
        // bound to it fail from then on. Also runs when an attached thread exits.
        static bool detach_current();

        static std::shared_ptr<dispatch_queue> current();
        static std::shared_ptr<dispatch_queue> find(std::thread::id id);

    private:
        // Items left in the batch after a shutdown() are destroyed unrun.
        std::size_t Execute(std::deque<invocation>& batch) {
            std::size_t executed = 0;
            for (auto& item : batch) {
                if (discarded_.load(std::memory_order_acquire)) {
                    break;
                }
                detail::execute(item);
                ++executed;
            }
            return executed;
        }

        mutable std::mutex      mutex_;
        std::condition_variable cv_;
        std::deque<invocation>  items_;
        bool                    closed_ = false;
        std::atomic_bool        discarded_ = false;
    };

    namespace detail {
        // Process-wide map from thread id to the queue that thread drains.
        struct dispatch_registry {
            static dispatch_registry& instance() {
                static dispatch_registry registry;
                return registry;
            }

            std::shared_ptr<dispatch_queue> Attach(std::thread::id id, std::shared_ptr<dispatch_queue> queue = nullptr) {
                std::lock_guard lock(mutex_);
                auto& slot = queues_[id];
                if (queue) {
                    slot = std::move(queue);
                }
                else if (!slot) {
                    slot = std::make_shared<dispatch_queue>();
                }
                return slot;
            }

            // Unregisters and shuts down the queue of a thread that is done with
            // it. The id may be handed to a new thread afterwards.
            std::shared_ptr<dispatch_queue> Retire(std::thread::id id) {
                std::shared_ptr<dispatch_queue> queue;
                {
                    std::lock_guard lock(mutex_);
                    auto it = queues_.find(id);
                    if (it == queues_.end()) {
                        return nullptr;
                    }
                    queue = std::move(it->second);
                    queues_.erase(it);
                }
                queue->shutdown();
                return queue;
            }

            std::size_t Size() {
                std::lock_guard lock(mutex_);
                return queues_.size();
            }

            std::shared_ptr<dispatch_queue> Find(std::thread::id id) {
                std::lock_guard lock(mutex_);
                auto it = queues_.find(id);
                return it == queues_.end() ? nullptr : it->second;
            }

        private:
            std::mutex mutex_;
            std::unordered_map<std::thread::id, std::shared_ptr<dispatch_queue>> queues_;
        };

        // Retires the thread's queue when the thread exits.
        struct queue_attachment {
            ~queue_attachment() {
                if (attached_) {
                    dispatch_registry::instance().Retire(std::this_thread::get_id());
                }
            }

            bool attached_ = false;
        };
    }

    inline std::shared_ptr<dispatch_queue> dispatch_queue::attach_current() {
        auto& registry = detail::dispatch_registry::instance();
        static thread_local detail::queue_attachment attachment;
        attachment.attached_ = true;
        return registry.Attach(std::this_thread::get_id());
    }

    inline bool dispatch_queue::detach_current() {
        return detail::dispatch_registry::instance().Retire(std::this_thread::get_id()) != nullptr;
    }

    inline std::shared_ptr<dispatch_queue> dispatch_queue::current() {
        return find(std::this_thread::get_id());
    }

    inline std::shared_ptr<dispatch_queue> dispatch_queue::find(std::thread::id id) {
        return detail::dispatch_registry::instance().Find(id);
    }
}

#endif // !RELAY_DISPATCH_QUEUE_HPP

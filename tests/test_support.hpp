#ifndef RELAY_TEST_SUPPORT_HPP
#define RELAY_TEST_SUPPORT_HPP

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "relay/dispatch_queue.hpp"
#include "relay/log.hpp"
#include "relay/thread_role.hpp"

namespace relay_test {
    using namespace std::chrono_literals;

    // Pumps the calling thread's dispatch queue until pred holds or the
    // timeout expires. Returns pred's final value.
    template <typename Pred>
    bool drain_until(Pred pred, std::chrono::milliseconds timeout = 5s) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return pred();
            }
            relay::wait_deferred(10ms);
        }
        return true;
    }

    // Thread that attaches a dispatch queue and drains it until stopped,
    // standing in for any thread with its own run loop.
    class queue_thread {
    public:
        queue_thread() {
            std::promise<std::shared_ptr<relay::dispatch_queue>> ready;
            auto attached = ready.get_future();
            thread_ = std::thread([ready = std::move(ready)]() mutable {
                auto queue = relay::dispatch_queue::attach_current();
                ready.set_value(queue);
                queue->run();
                relay::dispatch_queue::detach_current();
            });
            queue_ = attached.get();
            id_    = thread_.get_id();
        }

        ~queue_thread() {
            stop();
        }

        queue_thread(const queue_thread&)            = delete;
        queue_thread& operator=(const queue_thread&) = delete;

        // Drains what is queued, then retires the queue.
        void stop() {
            if (thread_.joinable()) {
                queue_->close();
                thread_.join();
            }
        }

        std::thread::id id() const noexcept {
            return id_;
        }

    private:
        std::thread                            thread_;
        std::shared_ptr<relay::dispatch_queue> queue_;
        std::thread::id                        id_;
    };

    // Records log lines; installed for the lifetime of the object.
    class capture_sink : public relay::log_sink {
    public:
        void write(relay::log_level level, std::string_view tag, std::string_view line) override {
            std::lock_guard lock(mutex_);
            lines_.push_back(std::string(1, relay::level_char(level)) + "|" + std::string(tag) + "|" + std::string(line));
        }

        std::vector<std::string> lines() const {
            std::lock_guard lock(mutex_);
            return lines_;
        }

        bool contains(std::string_view needle) const {
            std::lock_guard lock(mutex_);
            for (auto& line : lines_) {
                if (line.find(needle) != std::string::npos) {
                    return true;
                }
            }
            return false;
        }

    private:
        mutable std::mutex       mutex_;
        std::vector<std::string> lines_;
    };

    struct scoped_capture {
        scoped_capture() : sink(std::make_shared<capture_sink>()) {
            relay::logger::add_sink(sink);
        }
        ~scoped_capture() {
            relay::logger::remove_sink(sink);
        }

        scoped_capture(const scoped_capture&)            = delete;
        scoped_capture& operator=(const scoped_capture&) = delete;

        std::shared_ptr<capture_sink> sink;
    };
}

#endif // !RELAY_TEST_SUPPORT_HPP

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

#ifndef RELAY_SIGNAL_HPP
#define RELAY_SIGNAL_HPP

#include <atomic>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "dispatch_queue.hpp"
#include "error.hpp"
#include "log.hpp"
#include "thread_role.hpp"

namespace relay {
    enum class connection_type : std::uint8_t {
        direct,
        queued,
        blocking_queued,
        auto_connection,
    };

    struct connection_id {
        std::uint64_t value = 0;

        explicit operator bool() const noexcept {
            return value != 0;
        }

        friend auto operator<=>(const connection_id&, const connection_id&) = default;
    };

    namespace detail {
        template <typename Arg>
        concept signal_arg = std::copyable<Arg>;

        template <signal_arg... Args>
        struct slot_base {
            slot_base(connection_type type, std::optional<std::thread::id> required_thread)
                : type_(type), required_thread_(required_thread), target_(destination::bind(required_thread)) {}
            virtual ~slot_base() = default;

            virtual void Invoke(const Args&... args) = 0;

            std::atomic_bool               alive_ = true;
            connection_id                  id_;
            connection_type                type_;
            std::optional<std::thread::id> required_thread_;
            destination                    target_;
        };

        template <typename Slot, signal_arg... Args>
        struct slot_impl : slot_base<Args...> {
            template <typename S>
            slot_impl(S&& slot, connection_type type, std::optional<std::thread::id> required_thread)
                : slot_base<Args...>(type, required_thread), slot_(std::forward<S>(slot)) {}

            void Invoke(const Args&... args) override {
                std::invoke(slot_, args...);
            }

            Slot slot_;
        };

        // Lets a scoped_connection disconnect without knowing the signal's arguments.
        struct connection_owner {
            virtual ~connection_owner()            = default;
            virtual bool Disconnect(connection_id id) = 0;
        };

        // Index-addressable table: the entry for id lives at table_[id - first_id_].
        // Disconnected entries leave a null hole until they reach the front.
        template <signal_arg... Args>
        struct connection_registry : connection_owner {
            using slot = std::shared_ptr<slot_base<Args...>>;

            connection_id Register(slot new_slot) {
                std::lock_guard lock(mutex_);
                new_slot->id_ = connection_id{next_id_++};
                table_.push_back(new_slot);
                ++live_;
                return new_slot->id_;
            }

            bool Disconnect(connection_id id) override {
                std::lock_guard lock(mutex_);
                if (id.value < first_id_ || id.value >= next_id_) {
                    return false;
                }
                auto& entry = table_[id.value - first_id_];
                if (!entry) {
                    return false;
                }
                entry->alive_.store(false, std::memory_order_release);
                entry.reset();
                --live_;
                while (!table_.empty() && !table_.front()) {
                    table_.pop_front();
                    ++first_id_;
                }
                return true;
            }

            void Clear() {
                std::lock_guard lock(mutex_);
                for (auto& entry : table_) {
                    if (entry) {
                        entry->alive_.store(false, std::memory_order_release);
                    }
                }
                table_.clear();
                first_id_ = next_id_;
                live_     = 0;
            }

            std::vector<slot> Snapshot() {
                std::lock_guard lock(mutex_);
                std::vector<slot> slots;
                slots.reserve(live_);
                for (auto& entry : table_) {
                    if (entry) {
                        slots.push_back(entry);
                    }
                }
                return slots;
            }

            std::size_t Count() {
                std::lock_guard lock(mutex_);
                return live_;
            }

            std::atomic_bool blocked_ = false;

        private:
            std::mutex        mutex_;
            std::deque<slot>  table_;
            std::uint64_t     first_id_ = 1;
            std::uint64_t     next_id_  = 1;
            std::size_t       live_     = 0;
        };
    }

    // Move-only guard that disconnects its connection exactly once. Holds the
    // signal weakly: disposing after the signal is gone does nothing.
    class scoped_connection {
    public:
        scoped_connection() = default;

        scoped_connection(std::weak_ptr<detail::connection_owner> owner, connection_id id)
            : owner_(std::move(owner)), id_(id) {}

        ~scoped_connection() {
            dispose();
        }

        scoped_connection(const scoped_connection&)            = delete;
        scoped_connection& operator=(const scoped_connection&) = delete;

        scoped_connection(scoped_connection&& other) noexcept
            : owner_(std::move(other.owner_)), id_(std::exchange(other.id_, connection_id{})) {}

        scoped_connection& operator=(scoped_connection&& other) noexcept {
            if (this != &other) {
                dispose();
                owner_ = std::move(other.owner_);
                id_    = std::exchange(other.id_, connection_id{});
            }
            return *this;
        }

        // Returns whether this call performed the disconnect.
        bool dispose() {
            auto id = std::exchange(id_, connection_id{});
            if (!id) {
                return false;
            }
            auto owner = owner_.lock();
            owner_.reset();
            return owner ? owner->Disconnect(id) : false;
        }

        // Detaches the guard; the connection stays alive.
        connection_id release() noexcept {
            owner_.reset();
            return std::exchange(id_, connection_id{});
        }

        connection_id id() const noexcept {
            return id_;
        }

        bool is_active() const noexcept {
            return static_cast<bool>(id_) && !owner_.expired();
        }

    private:
        std::weak_ptr<detail::connection_owner> owner_;
        connection_id                           id_;
    };

    // Typed emission point. Copies of the arguments are taken only for queued
    // deliveries; direct slots see the emitter's arguments by const reference.
    template <detail::signal_arg... Args>
    class signal {
    public:
        using registry = detail::connection_registry<Args...>;

        signal() : registry_(std::make_shared<registry>()) {}

        // Pending queued deliveries of a destroyed signal are dropped.
        ~signal() {
            registry_->Clear();
        }

        signal(const signal&)            = delete;
        signal& operator=(const signal&) = delete;

        // auto_connection, affine to the connecting thread.
        template <typename Slot>
            requires std::invocable<std::decay_t<Slot>&, const Args&...>
        connection_id connect(Slot&& slot) {
            return connect_with_type(std::forward<Slot>(slot), connection_type::auto_connection);
        }

        template <typename Slot>
            requires std::invocable<std::decay_t<Slot>&, const Args&...>
        connection_id connect_with_type(Slot&& slot, connection_type type) {
            return connect_with_type(std::forward<Slot>(slot), type, std::this_thread::get_id());
        }

        // std::nullopt declares no thread affinity: auto_connection then always
        // runs directly and queued kinds target the owner thread.
        template <typename Slot>
            requires std::invocable<std::decay_t<Slot>&, const Args&...>
        connection_id connect_with_type(Slot&& slot, connection_type type, std::optional<std::thread::id> required_thread) {
            auto new_slot = std::make_shared<detail::slot_impl<std::decay_t<Slot>, Args...>>(
                std::forward<Slot>(slot), type, required_thread);
            return registry_->Register(std::move(new_slot));
        }

        template <typename Slot>
            requires std::invocable<std::decay_t<Slot>&, const Args&...>
        [[nodiscard]] scoped_connection connect_scoped(Slot&& slot, connection_type type = connection_type::auto_connection) {
            auto id = connect_with_type(std::forward<Slot>(slot), type);
            return scoped_connection(registry_, id);
        }

        template <typename Slot>
            requires std::invocable<std::decay_t<Slot>&, const Args&...>
        [[nodiscard]] scoped_connection connect_scoped(Slot&& slot, connection_type type, std::optional<std::thread::id> required_thread) {
            auto id = connect_with_type(std::forward<Slot>(slot), type, required_thread);
            return scoped_connection(registry_, id);
        }

        bool disconnect(connection_id id) {
            return registry_->Disconnect(id);
        }

        void disconnect_all() {
            registry_->Clear();
        }

        std::size_t connection_count() const {
            return registry_->Count();
        }

        void set_blocked(bool blocked) noexcept {
            registry_->blocked_.store(blocked, std::memory_order_release);
        }

        RELAY_ALWAYS_INLINE bool is_blocked() const noexcept {
            return registry_->blocked_.load(std::memory_order_acquire);
        }

        // Routes to every connection alive when the call starts. Blocking
        // deliveries are awaited after all connections were serviced; throws
        // delivery_error if any of them could not run.
        void emit(const Args&... args) {
            if (is_blocked()) {
                RELAY_LOG_TRACE(log_tags::signal, "signal blocked, skipping emit");
                return;
            }

            const auto current = std::this_thread::get_id();
            auto slots         = registry_->Snapshot();
            RELAY_LOG_TRACE(log_tags::signal, "emitting to ", slots.size(), " connection(s)");

            std::vector<std::shared_ptr<detail::completion_state>> waiters;
            std::size_t failed = 0;

            for (auto& entry : slots) {
                if (!entry->alive_.load(std::memory_order_acquire)) {
                    continue;
                }
                switch (entry->type_) {
                    case connection_type::direct:
                        entry->Invoke(args...);
                        break;
                    case connection_type::auto_connection:
                        if (!entry->required_thread_ || *entry->required_thread_ == current) {
                            entry->Invoke(args...);
                        }
                        else {
                            Post(entry, nullptr, args...);
                        }
                        break;
                    case connection_type::queued:
                        Post(entry, nullptr, args...);
                        break;
                    case connection_type::blocking_queued: {
                        auto destination = detail::resolve_destination(entry->required_thread_);
                        if (!destination || *destination == current) {
                            entry->Invoke(args...);
                            break;
                        }
                        auto completion = std::make_shared<detail::completion_state>();
                        if (Post(entry, completion, args...) == detail::delivery::rejected) {
                            ++failed;
                        }
                        else {
                            waiters.push_back(std::move(completion));
                        }
                        break;
                    }
                }
            }

            for (auto& waiter : waiters) {
                if (waiter->Wait() == detail::completion_state::status::abandoned) {
                    ++failed;
                }
            }

            if (failed != 0) {
                throw delivery_error(failed);
            }
        }

        // Queues a delivery for every live connection whatever its type.
        std::size_t emit_queued(const Args&... args) {
            if (is_blocked()) {
                return 0;
            }
            auto slots = registry_->Snapshot();
            std::size_t posted = 0;
            for (auto& entry : slots) {
                if (entry->alive_.load(std::memory_order_acquire)) {
                    Post(entry, nullptr, args...);
                    ++posted;
                }
            }
            return posted;
        }

    private:
        using slot = typename registry::slot;

        static detail::delivery Post(const slot& target, std::shared_ptr<detail::completion_state> completion, const Args&... args) {
            auto item = make_invocation(
                [target, values = std::tuple<Args...>(args...)]() {
                    // A connection dropped while the item was queued stays silent.
                    if (target->alive_.load(std::memory_order_acquire)) {
                        std::apply([&](const Args&... queued) { target->Invoke(queued...); }, values);
                    }
                });
            item->completion_ = std::move(completion);
            return detail::deliver(target->target_, std::move(item));
        }

        std::shared_ptr<registry> registry_;
    };
}

#endif // !RELAY_SIGNAL_HPP

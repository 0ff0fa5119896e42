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

#ifndef RELAY_PROGRESS_HPP
#define RELAY_PROGRESS_HPP

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"
#include "signal.hpp"

namespace relay {
    struct progress_update {
        float                      progress = 0.0f;
        std::optional<std::string> message;

        friend bool operator==(const progress_update&, const progress_update&) = default;
    };

    namespace detail {
        // NaN counts as no progress.
        inline float clamp_progress(float value) noexcept {
            if (std::isnan(value)) {
                return 0.0f;
            }
            return std::clamp(value, 0.0f, 1.0f);
        }

        inline bool progress_differs(float a, float b) noexcept {
            return std::fabs(a - b) > std::numeric_limits<float>::epsilon();
        }
    }

    // Shared progress state. Copies refer to the same reporter, so a task and
    // the code watching it can each hold one.
    class progress_reporter {
    public:
        progress_reporter() : state_(std::make_shared<state>()) {}

        RELAY_ALWAYS_INLINE float progress() const noexcept {
            return state_->progress_.load(std::memory_order_acquire);
        }

        std::optional<std::string> message() const {
            std::lock_guard lock(state_->mutex_);
            return state_->message_;
        }

        // Clamps to [0, 1]; emits only when the stored value changes.
        void set_progress(float value) {
            const float clamped = detail::clamp_progress(value);
            const float old     = state_->progress_.exchange(clamped, std::memory_order_acq_rel);
            if (!detail::progress_differs(clamped, old)) {
                return;
            }
            state_->progress_changed_.emit(clamped);
            state_->updated_.emit(progress_update{clamped, message()});
        }

        void set_message(std::string text) {
            {
                std::lock_guard lock(state_->mutex_);
                if (state_->message_ == text) {
                    return;
                }
                state_->message_ = text;
            }
            state_->message_changed_.emit(text);
            state_->updated_.emit(progress_update{progress(), std::move(text)});
        }

        // Sets both under one lock; on_updated fires once if either changed.
        void update(float value, std::string text) {
            const float clamped = detail::clamp_progress(value);
            bool progress_changed = false;
            bool message_changed  = false;
            {
                std::lock_guard lock(state_->mutex_);
                const float old  = state_->progress_.exchange(clamped, std::memory_order_acq_rel);
                progress_changed = detail::progress_differs(clamped, old);
                message_changed  = state_->message_ != text;
                state_->message_ = text;
            }
            if (progress_changed) {
                state_->progress_changed_.emit(clamped);
            }
            if (message_changed) {
                state_->message_changed_.emit(text);
            }
            if (progress_changed || message_changed) {
                state_->updated_.emit(progress_update{clamped, std::move(text)});
            }
        }

        // Always notifies, even when already at zero.
        void reset() {
            {
                std::lock_guard lock(state_->mutex_);
                state_->progress_.store(0.0f, std::memory_order_release);
                state_->message_.reset();
            }
            state_->progress_changed_.emit(0.0f);
            state_->updated_.emit(progress_update{});
        }

        signal<float>& on_progress_changed() const noexcept {
            return state_->progress_changed_;
        }

        signal<std::string>& on_message_changed() const noexcept {
            return state_->message_changed_;
        }

        signal<progress_update>& on_updated() const noexcept {
            return state_->updated_;
        }

        friend bool operator==(const progress_reporter& lhs, const progress_reporter& rhs) noexcept {
            return lhs.state_ == rhs.state_;
        }

    private:
        struct state {
            std::atomic<float>         progress_ = 0.0f;
            std::mutex                 mutex_;
            std::optional<std::string> message_;
            signal<float>              progress_changed_;
            signal<std::string>        message_changed_;
            signal<progress_update>    updated_;
        };

        std::shared_ptr<state> state_;
    };

    // Weighted mean of sub-task reporters, re-emitted on every sub-task change.
    class aggregate_progress {
    public:
        aggregate_progress() : state_(std::make_shared<state>()) {}

        aggregate_progress(const aggregate_progress&)            = delete;
        aggregate_progress& operator=(const aggregate_progress&) = delete;

        progress_reporter add_task(std::string name, float weight) {
            if (!(weight > 0.0f) || !std::isfinite(weight)) {
                throw std::invalid_argument("Can't add task '" + name + "': weight must be positive and finite.");
            }

            progress_reporter reporter;
            std::weak_ptr<state> weak = state_;
            auto connection = reporter.on_progress_changed().connect_scoped(
                [weak](float) {
                    if (auto self = weak.lock()) {
                        self->progress_changed_.emit(self->Progress());
                    }
                },
                connection_type::direct, std::nullopt);

            std::lock_guard lock(state_->mutex_);
            state_->tasks_.push_back(sub_task{std::move(name), weight, reporter, std::move(connection)});
            state_->total_weight_ += weight;
            RELAY_LOG_DEBUG(log_tags::progress, "aggregate now tracks ", state_->tasks_.size(), " task(s)");
            return reporter;
        }

        float progress() const {
            return state_->Progress();
        }

        std::size_t task_count() const {
            std::lock_guard lock(state_->mutex_);
            return state_->tasks_.size();
        }

        // Resets every sub-task, then reports zero once more.
        void reset() {
            std::vector<progress_reporter> reporters;
            {
                std::lock_guard lock(state_->mutex_);
                for (auto& task : state_->tasks_) {
                    reporters.push_back(task.reporter_);
                }
            }
            for (auto& reporter : reporters) {
                reporter.reset();
            }
            state_->progress_changed_.emit(0.0f);
        }

        void emit_progress() {
            state_->progress_changed_.emit(state_->Progress());
        }

        signal<float>& on_progress_changed() const noexcept {
            return state_->progress_changed_;
        }

    private:
        struct sub_task {
            std::string       name_;
            float             weight_;
            progress_reporter reporter_;
            scoped_connection connection_;
        };

        struct state {
            float Progress() const {
                std::lock_guard lock(mutex_);
                if (total_weight_ <= 0.0f) {
                    return 0.0f;
                }
                float weighted = 0.0f;
                for (auto& task : tasks_) {
                    weighted += task.reporter_.progress() * task.weight_;
                }
                return std::clamp(weighted / total_weight_, 0.0f, 1.0f);
            }

            mutable std::mutex    mutex_;
            std::vector<sub_task> tasks_;
            float                 total_weight_ = 0.0f;
            signal<float>         progress_changed_;
        };

        std::shared_ptr<state> state_;
    };
}

#endif // !RELAY_PROGRESS_HPP

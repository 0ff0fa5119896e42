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

#ifndef RELAY_CANCELLATION_HPP
#define RELAY_CANCELLATION_HPP

#include <stdexec/stop_token.hpp>
#include <memory>

#include "config.hpp"

namespace relay {
    // Shared, cooperative "please stop" flag. Copies observe the same state.
    // The stop token lets stdexec senders composed by the caller see the
    // same cancellation.
    class cancellation_token {
    public:
        cancellation_token() : source_(std::make_shared<stdexec::inplace_stop_source>()) {}

        // Idempotent; safe after the task finished.
        void cancel() const noexcept {
            source_->request_stop();
        }

        RELAY_ALWAYS_INLINE bool is_cancelled() const noexcept {
            return source_->stop_requested();
        }

        stdexec::inplace_stop_token get_stop_token() const noexcept {
            return source_->get_token();
        }

        friend bool operator==(const cancellation_token&, const cancellation_token&) = default;

    private:
        std::shared_ptr<stdexec::inplace_stop_source> source_;
    };
}

#endif // !RELAY_CANCELLATION_HPP

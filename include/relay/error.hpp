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

#ifndef RELAY_ERROR_HPP
#define RELAY_ERROR_HPP

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace relay {
    struct error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Owner thread designated twice, or a thread affinity check failed.
    struct thread_role_error : error {
        using error::error;
    };

    // One or more blocking deliveries of a single emit never ran because
    // their destination queue was closed.
    struct delivery_error : error {
        explicit delivery_error(std::size_t failed)
            : error("Can't deliver signal: " + std::to_string(failed) +
                    " blocking connection(s) target a thread whose dispatch queue is closed."),
              failed_(failed) {}

        std::size_t failed_deliveries() const noexcept {
            return failed_;
        }

    private:
        std::size_t failed_;
    };

    struct pool_error : error {
        using error::error;
    };

    namespace detail {
        inline std::string describe(std::exception_ptr ptr) {
            if (!ptr) {
                return "no exception";
            }
            try {
                std::rethrow_exception(ptr);
            }
            catch (const std::exception& e) {
                return e.what();
            }
            catch (...) {
                return "non-standard exception";
            }
        }
    }
}

#endif // !RELAY_ERROR_HPP

// Copyright 2024-2025 SpecDec Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "core/defines.hpp"
#include "core/exception.hpp"
#include "core/getenv.hpp"
#include "fmt/core.h"
#include "fmt/ranges.h"
#include "fmt/std.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

namespace specdec {

// Debug output is off unless SPECDEC_DEBUG is set or a config turns it on.
inline auto debug_logging_flag() -> std::atomic<bool> & {
    static std::atomic<bool> enabled = getenv<bool>("SPECDEC_DEBUG", false);
    return enabled;
}

inline void set_debug_logging(bool enabled) {
    debug_logging_flag().store(enabled, std::memory_order_relaxed);
}

inline bool debug_logging_enabled() {
    return debug_logging_flag().load(std::memory_order_relaxed);
}

template <typename... Args>
inline void log_line(FILE *stream, std::string_view level, fmt::format_string<Args...> format, Args &&...args) {
    fmt::print(stream, "{}{}\n", level, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace specdec

#ifndef SPECDEC_LOG_DEBUG
#define SPECDEC_LOG_DEBUG(...)                                                                                         \
    do {                                                                                                               \
        if (::specdec::debug_logging_enabled()) {                                                                      \
            ::specdec::log_line(stdout, "[DEBUG] ", __VA_ARGS__);                                                      \
        }                                                                                                              \
    } while (0)
#endif // SPECDEC_LOG_DEBUG

#ifndef SPECDEC_LOG_INFO
#define SPECDEC_LOG_INFO(...) ::specdec::log_line(stdout, "[INFO ] ", __VA_ARGS__)
#endif // SPECDEC_LOG_INFO

#ifndef SPECDEC_LOG_WARN
#define SPECDEC_LOG_WARN(...) ::specdec::log_line(stderr, "[WARN ] ", __VA_ARGS__)
#endif // SPECDEC_LOG_WARN

#ifndef SPECDEC_LOG_ERROR
#define SPECDEC_LOG_ERROR(...) ::specdec::log_line(stderr, "[ERROR] ", __VA_ARGS__)
#endif // SPECDEC_LOG_ERROR

#ifndef SPECDEC_ABORT
#define SPECDEC_ABORT(...)                                                                                             \
    do {                                                                                                               \
        fflush(stdout);                                                                                                \
        fflush(stderr);                                                                                                \
        SPECDEC_LOG_ERROR("{}:{}: {}: Abort", __FILE__, __LINE__, __func__);                                           \
        SPECDEC_LOG_ERROR("" __VA_ARGS__);                                                                             \
        abort();                                                                                                       \
    } while (0)
#endif // SPECDEC_ABORT

#if defined(SPECDEC_NO_ASSERT)
#define SPECDEC_ASSERT(expr, ...) SPECDEC_UNUSED(expr)
#elif !defined(SPECDEC_ASSERT)
#define SPECDEC_ASSERT(expr, ...)                                                                                      \
    do {                                                                                                               \
        if (!(expr)) [[unlikely]] {                                                                                    \
            fflush(stdout);                                                                                            \
            fflush(stderr);                                                                                            \
            SPECDEC_LOG_ERROR("{}:{}: {}: Assertion failed: {}", __FILE__, __LINE__, __func__, #expr);                 \
            SPECDEC_LOG_ERROR("" __VA_ARGS__);                                                                         \
            abort();                                                                                                   \
        }                                                                                                              \
    } while (0)
#endif // SPECDEC_ASSERT

namespace specdec {

inline std::string abbreviation(std::string text, size_t limit) {
    auto len = text.length();
    if (len > limit) {
        return fmt::format("{}...[omit {} chars]", text.substr(0, limit), len - limit);
    }
    return text;
}

} // namespace specdec

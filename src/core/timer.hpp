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

#include <chrono>
#include <cstdint>

namespace specdec {

auto timestamp_ns() -> int64_t;
auto timestamp_ms() -> int64_t;

struct Timer {
    Timer();

    // Return elapsed time since construction or the last reset().
    auto elapsed_time_ns() const -> int64_t;

    void reset();

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point last_time_point;
};

// Adds the lifetime of the scope to `sink_ns` on destruction.
struct ScopedTimer {
    int64_t &m_sink_ns;
    Timer m_timer;

    explicit ScopedTimer(int64_t &sink_ns) : m_sink_ns(sink_ns) {}

    ~ScopedTimer() {
        m_sink_ns += m_timer.elapsed_time_ns();
    }
};

} // namespace specdec

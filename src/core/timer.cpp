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

#include "core/timer.hpp"

namespace specdec {

auto timestamp_ns() -> int64_t {
    auto timepoint = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(timepoint).count();
}

auto timestamp_ms() -> int64_t {
    return (timestamp_ns() + 999999) / 1000000;
}

Timer::Timer() {
    reset();
}

auto Timer::elapsed_time_ns() const -> int64_t {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - last_time_point).count();
}

void Timer::reset() {
    last_time_point = Clock::now();
}

} // namespace specdec

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

#include "core/typedefs.hpp"

#include <cstdint>
#include <random>

namespace specdec {

///
/// @brief The single source of randomness for one generation run
/// @note  Every uniform draw and categorical sample in the protocol goes through the same
/// engine, so a fixed seed reproduces the whole run.
///
struct RandomSource final : Noncopyable {
    static constexpr uint64_t random_seed = (uint64_t)-1;

    std::mt19937 m_engine;
    uint64_t m_seed;

    // seed == random_seed picks a fresh seed from std::random_device.
    explicit RandomSource(uint64_t seed) : m_seed(seed) {
        if (m_seed == random_seed) {
            std::random_device rd;
            m_seed = rd();
        }
        m_engine.seed(static_cast<std::mt19937::result_type>(m_seed));
    }

    // Uniform variate in [0, 1).
    auto uniform() -> double {
        return std::uniform_real_distribution<double>(0.0, 1.0)(m_engine);
    }

    auto engine() -> std::mt19937 & {
        return m_engine;
    }

    auto seed() const -> uint64_t {
        return m_seed;
    }
};

} // namespace specdec

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
#include "core/random.hpp"
#include "core/typedefs.hpp"
#include "sampler/prob_array.hpp"

#include <cstddef>
#include <span>

namespace specdec {

struct Sampler {
    virtual ~Sampler() = default;

    virtual void apply(ProbArray &probs) = 0;

    virtual void accept(Token token) {
        SPECDEC_UNUSED(token);
    }
};

struct TemperatureSampler final : Sampler {
    float m_temperature = 1.0f;

    TemperatureSampler(float temperature) : m_temperature(temperature) {}

    void apply(ProbArray &probs) override;
};

struct SoftmaxSampler final : Sampler {
    void apply(ProbArray &probs) override;
};

struct NormalizeSampler final : Sampler {
    void apply(ProbArray &probs) override;
};

struct TopKSampler final : Sampler {
    size_t m_topk = 40;

    TopKSampler(size_t topk) : m_topk(topk) {}

    void apply(ProbArray &probs) override;
};

struct TopPSampler final : Sampler {
    float m_topp      = 0.95f;
    size_t m_min_keep = 1; // never cut below this many candidates

    TopPSampler(float topp, size_t min_keep = 1) : m_topp(topp), m_min_keep(min_keep) {}

    void apply(ProbArray &probs) override;
};

// Draws one token from the (normalized) candidates using the shared random source.
struct StochasticSampler final : Sampler {
    RandomSource &m_random;

    StochasticSampler(RandomSource &random) : m_random(random) {}

    void apply(ProbArray &probs) override;
};

struct GreedySampler final : Sampler {
    void apply(ProbArray &probs) override;
};

///
/// @brief Run a sampler over one row of next-token logits and return the chosen token
/// @note  The sampler must reduce the candidates to exactly one entry, which is what a
/// chain ending in StochasticSampler or GreedySampler does.
///
auto sample_token(Sampler &sampler, std::span<const float> logits) -> Token;

} // namespace specdec

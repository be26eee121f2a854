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

#include "core/logits.hpp"
#include "core/random.hpp"
#include "core/typedefs.hpp"
#include "sampler/sampler.hpp"
#include "speculative/speculative_config.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace specdec {

struct AcceptanceResult {
    size_t n_accepted  = 0;     // speculative tokens that passed the test
    size_t n_committed = 0;     // tokens appended to the sequence, always in [1, K + 1]
    bool corrected     = false; // a rejected token was replaced from the residual distribution
    bool bonus         = false; // every speculative token passed and one extra token was sampled
    bool fallback      = false; // the residual had no mass and p_target was used instead
};

///
/// @brief min(1, p_target / p_draft) for the drafted token
/// @note  p_draft == 0 can only come from underflow of a token the draft still produced; the
/// ratio is then 1 if the target gives the token any mass and 0 otherwise.
///
auto acceptance_ratio(float p_target, float p_draft) -> float;

///
/// @brief normalize(max(0, p_target - p_draft))
/// @return std::nullopt when the positive part has no mass (the draft dominates everywhere)
///
auto residual_distribution(std::span<const float> p_target, std::span<const float> p_draft)
    -> std::optional<std::vector<float>>;

///
/// @brief Accept/reject test over one drafted continuation
/// @note  Tokens are committed in order through the callback. The first rejection commits one
/// token from the residual distribution and ends the scan; if nothing is rejected one bonus
/// token is sampled from the last target row. Every committed token is distributed exactly
/// as the target model's next-token distribution.
///
struct AcceptanceEngine {
    using CommitTokenFn = std::function<void(Token token)>;

public:
    AcceptanceEngine(const SpeculativeConfig &config, Sampler &sampler, RandomSource &random) :
        m_config(config),
        m_sampler(sampler),
        m_random(random) {}

    ~AcceptanceEngine() = default;

public:
    ///
    /// @param[in] draft_tokens  The K speculative tokens
    /// @param[in] draft_logits  (1, K, vocab) logits the draft tokens were sampled from
    /// @param[in] target_logits (1, K + 1, vocab) logits from the verifier
    ///
    auto accept(
        std::span<const Token> draft_tokens,
        const LogitsTensor &draft_logits,
        const LogitsTensor &target_logits,
        const CommitTokenFn &commit_token
    ) -> AcceptanceResult;

private:
    const SpeculativeConfig &m_config;
    Sampler &m_sampler;
    RandomSource &m_random;

    auto sample_correction(std::span<const float> p_target, std::span<const float> p_draft, AcceptanceResult &result)
        -> Token;
};

} // namespace specdec

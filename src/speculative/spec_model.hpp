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

#include "core/random.hpp"
#include "core/typedefs.hpp"
#include "model/model.hpp"
#include "sampler/sampler.hpp"
#include "speculative/acceptance_engine.hpp"
#include "speculative/speculative_config.hpp"
#include "speculative/speculative_stats.hpp"

#include <functional>
#include <vector>

namespace specdec {

struct GenerationResult {
    TokenSequence tokens; // prompt followed by every committed token
    SpeculativeStats stats;

    auto n_accepted() const -> size_t {
        return stats.n_accepted_tokens;
    }

    auto n_attempted() const -> size_t {
        return stats.n_attempted_tokens;
    }
};

///
/// @brief Drives draft -> verify -> accept iterations until enough tokens are committed
/// @note  Single sequence, single thread. Each iteration is atomic: it either commits between
/// 1 and K + 1 tokens or throws. The last iteration is not truncated, so the output may
/// exceed the requested length by up to K tokens.
///
struct SpeculativeModel {
public:
    // Called after every committed token with the sequence so far and the new token.
    using ProgressFn = std::function<void(const TokenSequence &tokens, Token token)>;

    const ModelPtr target_model;
    const ModelPtr draft_model;
    SpeculativeConfig config;

public:
    SpeculativeModel(const ModelPtr &target_model, const ModelPtr &draft_model, const SpeculativeConfig &config) :
        target_model(target_model),
        draft_model(draft_model),
        config(config) {}

    ~SpeculativeModel() = default;

public:
    ///
    /// @brief Generate at least `n_predicts` tokens after `prompt`
    /// @param[in] sampler Sampling strategy for draft tokens and the bonus token
    /// @param[in] random  Source of every uniform draw and residual sample
    ///
    auto generate(
        const TokenSequence &prompt,
        int n_predicts,
        Sampler &sampler,
        RandomSource &random,
        const ProgressFn &progress = nullptr
    ) -> GenerationResult;

    // Batched entry point; only a batch of exactly one sequence is supported.
    auto generate(
        const std::vector<TokenSequence> &prompts,
        int n_predicts,
        Sampler &sampler,
        RandomSource &random,
        const ProgressFn &progress = nullptr
    ) -> GenerationResult;

    ///
    /// @brief One draft -> verify -> accept iteration, appending to `tokens`
    /// @note  Preconditions are those of generate() and are not re-checked here.
    ///
    auto step(
        TokenSequence &tokens,
        Sampler &sampler,
        RandomSource &random,
        SpeculativeStats &stats,
        const ProgressFn &progress = nullptr
    ) -> AcceptanceResult;

private:
    void check_preconditions(const TokenSequence &prompt, int n_predicts) const;
};

} // namespace specdec

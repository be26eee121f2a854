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

#include "speculative/spec_model.hpp"

#include "core/exception.hpp"
#include "core/logger.hpp"
#include "core/timer.hpp"
#include "speculative/draft_sampler.hpp"
#include "speculative/verifier.hpp"

#include <span>

namespace specdec {

void SpeculativeModel::check_preconditions(const TokenSequence &prompt, int n_predicts) const {
    SPECDEC_ASSERT_PRECONDITION(n_predicts > 0, "SpeculativeModel", "n_predicts must be > 0, got {}", n_predicts);
    SPECDEC_ASSERT_PRECONDITION(
        config.draft_length >= 1, "SpeculativeModel", "draft length must be >= 1, got {}", config.draft_length
    );
    SPECDEC_ASSERT_PRECONDITION(
        config.temperature > 0, "SpeculativeModel", "temperature must be > 0, got {}", config.temperature
    );
    SPECDEC_ASSERT_PRECONDITION(!prompt.empty(), "SpeculativeModel", "prompt must contain at least one token");
    SPECDEC_ASSERT_PRECONDITION(target_model && draft_model, "SpeculativeModel", "both models must be set");
    SPECDEC_ASSERT_PRECONDITION(
        target_model->vocab_size() == draft_model->vocab_size(),
        "SpeculativeModel",
        "draft vocabulary {} differs from target vocabulary {}",
        draft_model->vocab_size(),
        target_model->vocab_size()
    );
}

auto SpeculativeModel::generate(
    const TokenSequence &prompt, int n_predicts, Sampler &sampler, RandomSource &random, const ProgressFn &progress
) -> GenerationResult {
    check_preconditions(prompt, n_predicts);

    GenerationResult result;
    result.tokens = prompt;

    const size_t n_target = prompt.size() + static_cast<size_t>(n_predicts);
    while (result.tokens.size() < n_target) {
        SPECDEC_LOG_DEBUG("current length: {}", result.tokens.size());
        step(result.tokens, sampler, random, result.stats, progress);
    }

    return result;
}

auto SpeculativeModel::generate(
    const std::vector<TokenSequence> &prompts,
    int n_predicts,
    Sampler &sampler,
    RandomSource &random,
    const ProgressFn &progress
) -> GenerationResult {
    SPECDEC_ASSERT_PRECONDITION(
        prompts.size() == 1, "SpeculativeModel", "batch size must be 1, got {} sequences", prompts.size()
    );
    return generate(prompts.front(), n_predicts, sampler, random, progress);
}

auto SpeculativeModel::step(
    TokenSequence &tokens, Sampler &sampler, RandomSource &random, SpeculativeStats &stats, const ProgressFn &progress
) -> AcceptanceResult {
    const size_t n_draft  = config.draft_length;
    const size_t n_before = tokens.size();

    DraftResult draft;
    {
        ScopedTimer timer(stats.draft_time_ns);
        draft = DraftSampler(draft_model, sampler).draft(tokens, n_draft);
    }
    stats.n_draft_forwards += n_draft;

    LogitsTensor target_logits;
    {
        ScopedTimer timer(stats.verify_time_ns);
        target_logits = Verifier(target_model).verify(draft.tokens, n_draft);
    }
    stats.n_target_forwards += 1;

    AcceptanceEngine engine(config, sampler, random);
    auto speculative = std::span<const Token>(draft.tokens).subspan(n_before);
    auto result      = engine.accept(speculative, draft.logits, target_logits, [&](Token token) {
        tokens.push_back(token);
        if (progress) {
            progress(tokens, token);
        }
    });

    const size_t n_committed = tokens.size() - n_before;
    SPECDEC_ASSERT(n_committed == result.n_committed);
    SPECDEC_ASSERT(n_committed >= 1 && n_committed <= n_draft + 1, "iteration committed {} tokens", n_committed);

    stats.n_iterations += 1;
    stats.n_attempted_tokens += n_draft;
    stats.n_accepted_tokens += result.n_accepted;
    stats.n_corrected_tokens += result.corrected ? 1 : 0;
    stats.n_bonus_tokens += result.bonus ? 1 : 0;
    stats.n_residual_fallbacks += result.fallback ? 1 : 0;
    stats.n_generated_tokens += n_committed;

    SPECDEC_LOG_DEBUG(
        "iteration {}: accepted {}/{}, committed {}",
        stats.n_iterations,
        result.n_accepted,
        n_draft,
        std::span<const Token>(tokens).subspan(n_before)
    );
    return result;
}

} // namespace specdec

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

#include "speculative/acceptance_engine.hpp"

#include "core/exception.hpp"
#include "core/logger.hpp"
#include "sampler/prob_array.hpp"
#include "sampler/temperature_distribution.hpp"

#include <algorithm>
#include <cmath>

namespace specdec {

auto acceptance_ratio(float p_target, float p_draft) -> float {
    if (!(p_target > 0.0f)) {
        return 0.0f;
    }
    if (!(p_draft > 0.0f)) {
        return 1.0f;
    }
    return std::clamp(p_target / p_draft, 0.0f, 1.0f);
}

auto residual_distribution(std::span<const float> p_target, std::span<const float> p_draft)
    -> std::optional<std::vector<float>> {
    SPECDEC_ASSERT_PRECONDITION(
        p_target.size() == p_draft.size(),
        "residual_distribution",
        "target has {} entries, draft has {}",
        p_target.size(),
        p_draft.size()
    );

    std::vector<float> residual(p_target.size());
    double sum = 0.0;
    for (size_t i = 0; i < residual.size(); i++) {
        residual[i] = std::max(0.0f, p_target[i] - p_draft[i]);
        sum += residual[i];
    }

    if (!(sum > 0.0)) {
        return std::nullopt;
    }

    for (auto &p : residual) {
        p = static_cast<float>(p / sum);
    }
    return residual;
}

auto AcceptanceEngine::accept(
    std::span<const Token> draft_tokens,
    const LogitsTensor &draft_logits,
    const LogitsTensor &target_logits,
    const CommitTokenFn &commit_token
) -> AcceptanceResult {
    const size_t n_draft = draft_tokens.size();
    SPECDEC_ASSERT_PRECONDITION(n_draft >= 1, "AcceptanceEngine", "no draft tokens to verify");
    SPECDEC_ASSERT_PRECONDITION(
        draft_logits.n_positions() == n_draft && target_logits.n_positions() == n_draft + 1,
        "AcceptanceEngine",
        "{} draft tokens need {} draft rows and {} target rows, got {} and {}",
        n_draft,
        n_draft,
        n_draft + 1,
        draft_logits.n_positions(),
        target_logits.n_positions()
    );
    SPECDEC_ASSERT_MODULE(
        draft_logits.n_vocab() == target_logits.n_vocab(),
        "AcceptanceEngine",
        "model",
        "draft vocabulary {} differs from target vocabulary {}",
        draft_logits.n_vocab(),
        target_logits.n_vocab()
    );

    auto draft_probs  = temperature_distribution(draft_logits, m_config.temperature);
    auto target_probs = temperature_distribution(target_logits, m_config.temperature);

    AcceptanceResult result;
    for (size_t t = 0; t < n_draft; t++) {
        const Token token = draft_tokens[t];
        SPECDEC_ASSERT_PRECONDITION(
            token >= 0 && (size_t)token < draft_probs.n_vocab(),
            "AcceptanceEngine",
            "draft token {} outside vocabulary of size {}",
            token,
            draft_probs.n_vocab()
        );

        const float p_target = target_probs.at(t, token);
        const float p_draft  = draft_probs.at(t, token);
        const float ratio    = acceptance_ratio(p_target, p_draft);
        const double u       = m_random.uniform();

        if (u < ratio) {
            SPECDEC_LOG_DEBUG(
                "draft token #{} ({}) accepted: u = {:.4f}, p_target = {:.4f}, p_draft = {:.4f}",
                t,
                token,
                u,
                p_target,
                p_draft
            );
            commit_token(token);
            result.n_accepted += 1;
            result.n_committed += 1;
            continue;
        }

        SPECDEC_LOG_DEBUG(
            "draft token #{} ({}) rejected: u = {:.4f}, p_target = {:.4f}, p_draft = {:.4f}",
            t,
            token,
            u,
            p_target,
            p_draft
        );
        auto replacement = sample_correction(target_probs.row(t), draft_probs.row(t), result);
        commit_token(replacement);
        result.n_committed += 1;
        result.corrected = true;
        return result;
    }

    // Every speculative token passed; the verifier already scored one more position.
    auto bonus_token = sample_token(m_sampler, target_logits.row(n_draft));
    SPECDEC_LOG_DEBUG("all {} draft tokens accepted, bonus token {}", n_draft, bonus_token);
    commit_token(bonus_token);
    result.n_committed += 1;
    result.bonus = true;
    return result;
}

auto AcceptanceEngine::sample_correction(
    std::span<const float> p_target, std::span<const float> p_draft, AcceptanceResult &result
) -> Token {
    auto residual = residual_distribution(p_target, p_draft);
    if (residual) {
        return ProbArray::from_distribution(*residual).stochastic_sample(m_random.engine()).token;
    }

    SPECDEC_ASSERT_DISTRIBUTION(
        m_config.residual_fallback != ResidualFallback::Error,
        "AcceptanceEngine",
        "residual distribution max(0, p_target - p_draft) has zero mass"
    );

    // Zero residual mass means p_draft >= p_target everywhere, i.e. both are equal up to rounding.
    SPECDEC_LOG_WARN("residual distribution has zero mass, sampling from the target distribution");
    result.fallback = true;
    return ProbArray::from_distribution(p_target).stochastic_sample(m_random.engine()).token;
}

} // namespace specdec

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

#include "speculative/draft_sampler.hpp"

#include "core/exception.hpp"
#include "core/logger.hpp"

namespace specdec {

auto DraftSampler::draft(const TokenSequence &tokens, size_t n_draft) -> DraftResult {
    SPECDEC_ASSERT_PRECONDITION(n_draft >= 1, "DraftSampler", "draft length must be >= 1");
    SPECDEC_ASSERT_PRECONDITION(!tokens.empty(), "DraftSampler", "cannot draft from an empty sequence");

    DraftResult result;
    result.tokens = tokens;
    result.tokens.reserve(tokens.size() + n_draft);

    for (size_t step = 0; step < n_draft; step++) {
        auto logits = m_draft_model->forward(result.tokens);
        check_forward_output(*m_draft_model, logits, result.tokens.size());

        auto next_logits = logits.row(logits.n_positions() - 1);
        auto next_token  = sample_token(m_sampler, next_logits);

        result.logits.append_row(next_logits);
        result.tokens.push_back(next_token);
    }

    SPECDEC_LOG_DEBUG("drafted {}", std::span(result.tokens).subspan(tokens.size()));
    return result;
}

} // namespace specdec

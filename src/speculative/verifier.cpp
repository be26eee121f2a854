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

#include "speculative/verifier.hpp"

#include "core/exception.hpp"

namespace specdec {

auto Verifier::verify(const TokenSequence &tokens, size_t n_draft) -> LogitsTensor {
    SPECDEC_ASSERT_PRECONDITION(n_draft >= 1, "Verifier", "draft length must be >= 1");
    SPECDEC_ASSERT_PRECONDITION(
        tokens.size() > n_draft,
        "Verifier",
        "sequence of {} tokens cannot hold a prefix and {} speculative tokens",
        tokens.size(),
        n_draft
    );

    auto logits = m_target_model->forward(tokens);
    check_forward_output(*m_target_model, logits, tokens.size());

    // Position T - 1 predicts the first speculative token, T + K - 1 the bonus token.
    return logits.slice_positions(tokens.size() - n_draft - 1, n_draft + 1);
}

} // namespace specdec

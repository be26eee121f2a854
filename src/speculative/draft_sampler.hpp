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
#include "core/typedefs.hpp"
#include "model/model.hpp"
#include "sampler/sampler.hpp"

#include <cstddef>

namespace specdec {

struct DraftResult {
    TokenSequence tokens; // input sequence followed by the speculative tokens
    LogitsTensor logits;  // (1, n_draft, vocab), row t produced speculative token t
};

///
/// @brief Proposes speculative tokens by running the draft model autoregressively
/// @note  One draft forward per proposed token. Each step depends on the token sampled in
/// the previous step, so the steps are strictly sequential.
///
struct DraftSampler {
public:
    DraftSampler(const ModelPtr &draft_model, Sampler &sampler) : m_draft_model(draft_model), m_sampler(sampler) {}

    ~DraftSampler() = default;

public:
    auto draft(const TokenSequence &tokens, size_t n_draft) -> DraftResult;

private:
    ModelPtr m_draft_model;
    Sampler &m_sampler;
};

} // namespace specdec

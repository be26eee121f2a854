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

#include <cstddef>

namespace specdec {

///
/// @brief Scores a drafted continuation with a single target forward pass
///
struct Verifier {
public:
    Verifier(const ModelPtr &target_model) : m_target_model(target_model) {}

    ~Verifier() = default;

public:
    ///
    /// @brief Run the target model once over `tokens` (prefix + n_draft speculative tokens)
    /// @return (1, n_draft + 1, vocab) logits: row t scores speculative token t, the last row
    /// scores the token after the last speculative token
    ///
    auto verify(const TokenSequence &tokens, size_t n_draft) -> LogitsTensor;

private:
    ModelPtr m_target_model;
};

} // namespace specdec

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

#include "core/config.hpp"
#include "core/logits.hpp"
#include "core/typedefs.hpp"

#include <memory>
#include <string>

namespace specdec {

///
/// @brief Next-token scoring capability consumed by the speculative decoder
/// @note  The decoder never constructs, configures or mutates a model beyond calling forward().
///
struct Model {
public:
    std::shared_ptr<ModelConfig> m_config;

public:
    Model(const std::shared_ptr<ModelConfig> &config) : m_config(config) {}

    virtual ~Model() = default;

    ///
    /// @brief Score every position of `tokens`
    /// @return A (1, tokens.size(), vocab) tensor whose row i holds the logits of the token
    /// that follows tokens[0..i]
    ///
    virtual auto forward(const TokenSequence &tokens) -> LogitsTensor = 0;

public:
    auto vocab_size() const -> size_t {
        return m_config->vocab_size;
    }

    auto name() const -> const std::string & {
        return m_config->model_id.empty() ? m_config->arch : m_config->model_id;
    }
};

using ModelPtr = std::shared_ptr<Model>;

// Throw ModuleException unless `logits` is a (1, n_tokens, model.vocab_size()) tensor.
void check_forward_output(const Model &model, const LogitsTensor &logits, size_t n_tokens);

} // namespace specdec

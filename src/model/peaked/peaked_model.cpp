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

#include "model/peaked/peaked_model.hpp"

#include "core/exception.hpp"

namespace specdec {

PeakedModel::PeakedModel(const std::shared_ptr<ModelConfig> &config) : Model(config) {
    SPECDEC_ASSERT_CONFIG(
        config->peak_token >= 0 && (size_t)config->peak_token < config->vocab_size,
        "PeakedModel",
        "peak token {} outside vocabulary of size {}",
        config->peak_token,
        config->vocab_size
    );
}

auto PeakedModel::forward(const TokenSequence &tokens) -> LogitsTensor {
    LogitsTensor logits(1, tokens.size(), vocab_size(), m_config->floor_logit);
    for (size_t pos = 0; pos < tokens.size(); pos++) {
        logits.row(pos)[m_config->peak_token] = m_config->peak_logit;
    }
    return logits;
}

} // namespace specdec

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

#include "model/uniform_noise/uniform_noise_model.hpp"

namespace specdec {

UniformNoiseModel::UniformNoiseModel(const std::shared_ptr<ModelConfig> &config) :
    Model(config),
    m_engine(static_cast<std::mt19937::result_type>(config->seed)) {}

auto UniformNoiseModel::forward(const TokenSequence &tokens) -> LogitsTensor {
    LogitsTensor logits(1, tokens.size(), vocab_size());

    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    for (auto &value : logits.m_data) {
        value = dist(m_engine);
    }
    return logits;
}

} // namespace specdec

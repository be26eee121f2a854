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

#include "model/model.hpp"

#include <random>

namespace specdec {

// Fresh uniform logits in [-1, 1] for every position on every call. Has no notion of context.
struct UniformNoiseModel final : Model {
public:
    UniformNoiseModel(const std::shared_ptr<ModelConfig> &config);

    ~UniformNoiseModel() override = default;

public:
    auto forward(const TokenSequence &tokens) -> LogitsTensor override;

private:
    std::mt19937 m_engine;
};

} // namespace specdec

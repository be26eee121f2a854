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

namespace specdec {

///
/// @brief Every position scores `peak_token` at `peak_logit` and every other token at `floor_logit`
/// @note  With floor_logit = -inf the model puts all of its mass on a single token.
///
struct PeakedModel final : Model {
public:
    PeakedModel(const std::shared_ptr<ModelConfig> &config);

    ~PeakedModel() override = default;

public:
    auto forward(const TokenSequence &tokens) -> LogitsTensor override;
};

} // namespace specdec

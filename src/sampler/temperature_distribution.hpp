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

#include <span>
#include <string_view>
#include <vector>

namespace specdec {

///
/// @brief Throw DistributionException if a logits row cannot be turned into a distribution
/// @note  NaN and +inf are rejected. -inf is a valid "impossible token" marker as long as at
/// least one entry of the row is finite.
///
void check_logits(std::span<const float> logits, std::string_view tag);

///
/// @brief softmax(logits / temperature) of one vocabulary row, indexed by token id
/// @param[in] temperature Must be > 0
///
auto temperature_distribution(std::span<const float> logits, float temperature) -> std::vector<float>;

///
/// @brief Row-wise temperature_distribution() over every (batch, position)
/// @return A tensor of the same shape whose rows are probability simplices
///
auto temperature_distribution(const LogitsTensor &logits, float temperature) -> LogitsTensor;

} // namespace specdec

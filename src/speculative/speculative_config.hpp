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

#include "core/typedefs.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace specdec {

// What to sample from when max(0, p_target - p_draft) has no mass left.
enum class ResidualFallback {
    Target, // sample from p_target at the rejected position
    Error,  // raise DistributionException
};

auto parse_residual_fallback(std::string_view name) -> ResidualFallback;
auto to_string(ResidualFallback fallback) -> std::string;

struct SpeculativeConfig {
    size_t draft_length = 4; // K, speculative tokens proposed per iteration
    float temperature   = 1.0f;

    ResidualFallback residual_fallback = ResidualFallback::Target;
};

} // namespace specdec

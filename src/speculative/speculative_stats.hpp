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
#include <cstdint>
#include <string>

namespace specdec {

///
/// @brief Counters accumulated over one generation run
/// @note  Counting convention: every iteration adds K to n_attempted_tokens. n_accepted_tokens
/// only counts speculative tokens that passed the acceptance test; the replacement sampled on
/// rejection and the bonus token are counted in n_corrected_tokens and n_bonus_tokens.
/// So n_generated_tokens == n_accepted_tokens + n_corrected_tokens + n_bonus_tokens.
///
struct SpeculativeStats {
    size_t n_iterations         = 0;
    size_t n_attempted_tokens   = 0;
    size_t n_accepted_tokens    = 0;
    size_t n_corrected_tokens   = 0;
    size_t n_bonus_tokens       = 0;
    size_t n_generated_tokens   = 0;
    size_t n_residual_fallbacks = 0;
    size_t n_draft_forwards     = 0;
    size_t n_target_forwards    = 0;
    int64_t draft_time_ns       = 0;
    int64_t verify_time_ns      = 0;

    // accepted / attempted, 0 before the first iteration
    auto acceptance_rate() const -> double;
    auto tokens_per_iteration() const -> double;

    void print() const;

    auto to_json_string() const -> std::string;
    void dump(const Path &path) const;
};

} // namespace specdec

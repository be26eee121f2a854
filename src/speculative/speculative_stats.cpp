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

#include "speculative/speculative_stats.hpp"

#include "core/exception.hpp"
#include "fmt/core.h"
#include "nlohmann/json.hpp"

#include <fstream>

namespace specdec {

auto SpeculativeStats::acceptance_rate() const -> double {
    return n_attempted_tokens == 0 ? 0.0 : 1.0 * n_accepted_tokens / n_attempted_tokens;
}

auto SpeculativeStats::tokens_per_iteration() const -> double {
    return n_iterations == 0 ? 0.0 : 1.0 * n_generated_tokens / n_iterations;
}

void SpeculativeStats::print() const {
    fmt::print("Speculative sampling statistics:\n");
    fmt::print("- {} iterations, {} generated tokens\n", n_iterations, n_generated_tokens);
    fmt::print("- {:.3f} tokens/iteration\n", tokens_per_iteration());
    fmt::print(
        "- {} accepted, {} corrected, {} bonus, {} residual fallbacks\n",
        n_accepted_tokens,
        n_corrected_tokens,
        n_bonus_tokens,
        n_residual_fallbacks
    );
    fmt::print("- Accept ratio: {:.3f}% ({}/{})\n", 100.0 * acceptance_rate(), n_accepted_tokens, n_attempted_tokens);
    fmt::print("- {} draft forwards, {} target forwards\n", n_draft_forwards, n_target_forwards);
    fmt::print("- draft time: {:.3f} ms, verify time: {:.3f} ms\n", draft_time_ns / 1e6, verify_time_ns / 1e6);
}

auto SpeculativeStats::to_json_string() const -> std::string {
    nlohmann::json json = {
        {"n_iterations", n_iterations},
        {"n_attempted_tokens", n_attempted_tokens},
        {"n_accepted_tokens", n_accepted_tokens},
        {"n_corrected_tokens", n_corrected_tokens},
        {"n_bonus_tokens", n_bonus_tokens},
        {"n_generated_tokens", n_generated_tokens},
        {"n_residual_fallbacks", n_residual_fallbacks},
        {"n_draft_forwards", n_draft_forwards},
        {"n_target_forwards", n_target_forwards},
        {"draft_time_ns", draft_time_ns},
        {"verify_time_ns", verify_time_ns},
        {"acceptance_rate", acceptance_rate()},
    };
    return json.dump();
}

void SpeculativeStats::dump(const Path &path) const {
    std::ofstream dump_file(path);
    SPECDEC_ASSERT_CONFIG(dump_file.is_open(), "SpeculativeStats", "failed to open stats dump file {}", path);
    dump_file << to_json_string() << std::endl;
}

} // namespace specdec

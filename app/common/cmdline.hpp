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
#include "core/typedefs.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace specdec {

struct CommandLineArgument {
    /*
     * Environment Configuration
     */

    /// The workspace config (sampler, speculative and model sections), optional
    std::string config_path;

    /// Print per-iteration protocol decisions
    bool verbose = false;

    /*
     * Input & Output Configuration
     */

    /// Comma separated prompt token ids
    std::string prompt = "1,2,3,4,5";

    /// The minimum number of tokens to generate
    int num_predict = 10;

    /// Do not stream committed tokens
    bool quiet = false;

    /// Write the final statistics as JSON to this file
    std::string dump_stats_path;

    /*
     * Overrides, applied on top of the workspace config
     */

    /// Number of speculative tokens per iteration (K), must be >= 1
    std::optional<int64_t> draft_length;

    std::optional<uint64_t> seed;

    std::optional<float> temperature;

    /// Vocabulary size of both synthetic models, must be >= 1
    std::optional<int64_t> vocab_size;

    /// target | error
    std::string residual_fallback;
};

/*!
 * @brief Parse the command arguments from the program input.
 */
CommandLineArgument parse_command_line(const std::string_view program_name, int argc, char **argv);

/*!
 * @brief Parse and generate config according to the command line arguments.
 * @param[in] args The command line argument to overwrite config
 */
Config get_config_from_argument(const CommandLineArgument &args);

/*!
 * @brief Parse a comma separated list of token ids, e.g. "1, 2,3".
 */
TokenSequence parse_prompt_tokens(const std::string &text);

} // namespace specdec

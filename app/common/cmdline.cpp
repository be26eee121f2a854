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

#include "cmdline.hpp"

#include "CLI/CLI.hpp"
#include "core/config.hpp"
#include "core/exception.hpp"
#include "core/logger.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace specdec {

namespace {

// trim whitespace from the beginning and end of a string
std::string trim(const std::string &str) {
    size_t start = 0;
    size_t end   = str.size();
    while (start < end && isspace(static_cast<unsigned char>(str[start]))) {
        start += 1;
    }
    while (end > start && isspace(static_cast<unsigned char>(str[end - 1]))) {
        end -= 1;
    }
    return str.substr(start, end - start);
}

} // namespace

CommandLineArgument parse_command_line(const std::string_view program_name, int argc, char **argv) {
    CommandLineArgument args;

    CLI::App app(program_name.data());

    /*
     * Environment Configuration
     */
    app.add_option("-c,--config", args.config_path, "Set the path to the workspace config.");
    app.add_flag("-v,--verbose", args.verbose, "Print every accept/reject decision.");

    /*
     * Input & Output Configuration
     */
    app.add_option("-p,--prompt", args.prompt, "Set the prompt as comma separated token ids.")->capture_default_str();
    app.add_option("-n,--n-predicts", args.num_predict, "Specify the minimum number of tokens to generate.")
        ->capture_default_str();
    app.add_flag("-q,--quiet", args.quiet, "Do not stream committed tokens.");
    app.add_option("--dump-stats", args.dump_stats_path, "Write statistics as JSON to the given file.");

    /*
     * Overrides
     */
    app.add_option("-k,--draft-length", args.draft_length, "Set the number of speculative tokens per iteration.");
    app.add_option("-s,--seed", args.seed, "Set the sampling seed.");
    app.add_option("--temperature", args.temperature, "Set the sampling temperature.");
    app.add_option("--vocab-size", args.vocab_size, "Set the vocabulary size of both models.");
    app.add_option("--residual-fallback", args.residual_fallback, "Policy for an empty residual distribution.")
        ->check(CLI::IsMember({"target", "error"}));

    /*
     * Finalize
     */
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &err) {
        const int ret = app.exit(err);
        exit(ret);
    }

    return args;
}

Config get_config_from_argument(const CommandLineArgument &args) {
    Config config;
    if (!args.config_path.empty()) {
        config = Config(args.config_path);
    } else {
        config.target_model.model_id = "target";
        config.target_model.seed     = 1;
        config.draft_model.model_id  = "draft";
        config.draft_model.seed      = 2;
    }

    if (args.verbose) {
        config.verbose = true;
    }

    auto &speculative_config = config.speculative_config;
    auto &sampler_config     = config.sampler_config;

    if (args.draft_length) {
        SPECDEC_ASSERT_CONFIG(
            *args.draft_length >= 1, "CommandLine", "draft length must be >= 1, got {}", *args.draft_length
        );
        speculative_config.draft_length = static_cast<size_t>(*args.draft_length);
    }

    if (args.seed) {
        sampler_config.seed = *args.seed;
    }

    if (args.temperature) {
        sampler_config.temperature     = *args.temperature;
        speculative_config.temperature = *args.temperature;
    }

    if (args.vocab_size) {
        SPECDEC_ASSERT_CONFIG(
            *args.vocab_size >= 1 && *args.vocab_size <= std::numeric_limits<uint32_t>::max(),
            "CommandLine",
            "vocab size must be in [1, {}], got {}",
            std::numeric_limits<uint32_t>::max(),
            *args.vocab_size
        );
        config.target_model.vocab_size = static_cast<uint32_t>(*args.vocab_size);
        config.draft_model.vocab_size  = static_cast<uint32_t>(*args.vocab_size);
    }

    if (!args.residual_fallback.empty()) {
        speculative_config.residual_fallback = parse_residual_fallback(args.residual_fallback);
    }

    return config;
}

TokenSequence parse_prompt_tokens(const std::string &text) {
    TokenSequence tokens;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        Token token     = null_token;
        auto [ptr, ec]  = std::from_chars(item.data(), item.data() + item.size(), token);
        const bool good = ec == std::errc() && ptr == item.data() + item.size() && token >= 0;
        SPECDEC_ASSERT_CONFIG(good, "Prompt", "invalid token id {:?} in prompt {:?}", item, text);
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace specdec

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
#include "core/exception.hpp"
#include "core/logger.hpp"
#include "core/random.hpp"
#include "core/timer.hpp"
#include "model/model_loader.hpp"
#include "sampler/sampler_chain.hpp"
#include "speculative/spec_model.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>

int main(int argc, char *argv[]) {
    const specdec::CommandLineArgument args = specdec::parse_command_line("SpecDec CLI", argc, argv);

    try {
        const specdec::Config config = specdec::get_config_from_argument(args);
        specdec::set_debug_logging(config.verbose);

        std::shared_ptr<specdec::Model> target_model = specdec::load_model(config.target_model);
        std::shared_ptr<specdec::Model> draft_model  = specdec::load_model(config.draft_model);

        const auto &sampler_config     = config.sampler_config;
        const auto &speculative_config = config.speculative_config;

        specdec::RandomSource random(sampler_config.seed);
        specdec::SamplerChain sampler{sampler_config, random};
        if (!sampler_config.is_exact()) {
            SPECDEC_LOG_WARN("top-k / top-p / greedy sampling active, output only approximates the target model");
        }

        const specdec::TokenSequence prompt = specdec::parse_prompt_tokens(args.prompt);
        for (auto token : prompt) {
            SPECDEC_ASSERT_CONFIG(
                (size_t)token < target_model->vocab_size(),
                "Prompt",
                "token {} outside vocabulary of size {}",
                token,
                target_model->vocab_size()
            );
        }

        {
            SPECDEC_LOG_INFO("prompt            : {}", specdec::abbreviation(fmt::format("{}", prompt), 50));
            SPECDEC_LOG_INFO("n_predicts        : {}", args.num_predict);
            SPECDEC_LOG_INFO("draft length      : {}", speculative_config.draft_length);
            SPECDEC_LOG_INFO("temperature       : {}", speculative_config.temperature);
            SPECDEC_LOG_INFO("residual fallback : {}", specdec::to_string(speculative_config.residual_fallback));
            SPECDEC_LOG_INFO("seed              : {}", random.seed());
            SPECDEC_LOG_INFO("target / draft    : {} / {}", target_model->name(), draft_model->name());
        }

        specdec::SpeculativeModel spec_model(target_model, draft_model, speculative_config);

        specdec::SpeculativeModel::ProgressFn progress = nullptr;
        if (!args.quiet) {
            fmt::print("{}", fmt::join(prompt, " "));
            progress = [](const specdec::TokenSequence &, specdec::Token token) {
                fmt::print(" {}", token);
                fflush(stdout);
            };
        }

        const int64_t start = specdec::timestamp_ms();
        auto result         = spec_model.generate(prompt, args.num_predict, sampler, random, progress);
        const int64_t end   = specdec::timestamp_ms();

        if (!args.quiet) {
            fmt::print("\n");
        }

        const size_t n_generated = result.tokens.size() - prompt.size();
        SPECDEC_LOG_INFO("output: {}", result.tokens);
        SPECDEC_LOG_INFO(
            "accepted {} / attempted {} ({:.3f})",
            result.n_accepted(),
            result.n_attempted(),
            result.stats.acceptance_rate()
        );
        SPECDEC_LOG_INFO(
            "decode speed ({} tokens): {} tokens/s",
            n_generated,
            n_generated / (double)std::max<int64_t>(end - start, 1) * 1000
        );
        result.stats.print();

        if (!args.dump_stats_path.empty()) {
            result.stats.dump(args.dump_stats_path);
            SPECDEC_LOG_INFO("statistics written to {}", args.dump_stats_path);
        }
    } catch (const specdec::BasicException &err) {
        SPECDEC_LOG_ERROR("{}", err.what());
        return 1;
    }

    return 0;
}

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
#include "core/config.hpp"
#include "core/exception.hpp"
#include "model/model_loader.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

using namespace specdec;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    Path m_dir;

    void SetUp() override {
        auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir      = std::filesystem::temp_directory_path() / (std::string("specdec_") + info->name());
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(m_dir);
    }

    auto write(const std::string &name, const std::string &content) -> Path {
        auto path = m_dir / name;
        std::ofstream file(path);
        file << content;
        return path;
    }
};

} // namespace

TEST_F(ConfigFileTest, ParsesFullWorkspace) {
    auto path = write("workspace.json", R"({
        "sampler": {"seed": 42, "temperature": 0.7, "top_k": 0, "top_p": 1.0},
        "speculative": {"draft_length": 6, "residual_fallback": "error"},
        "model_target": {"arch": "peaked", "model_id": "big", "vocab_size": 32, "peak_token": 3, "peak_logit": 5.0},
        "model_draft": {"arch": "uniform_noise", "vocab_size": 32, "seed": 9},
        "verbose": true
    })");

    Config config(path);
    EXPECT_EQ(config.sampler_config.seed, 42u);
    EXPECT_FLOAT_EQ(config.sampler_config.temperature, 0.7f);
    EXPECT_TRUE(config.sampler_config.is_exact());
    EXPECT_EQ(config.speculative_config.draft_length, 6u);
    EXPECT_FLOAT_EQ(config.speculative_config.temperature, 0.7f);
    EXPECT_EQ(config.speculative_config.residual_fallback, ResidualFallback::Error);
    EXPECT_EQ(config.target_model.arch, "peaked");
    EXPECT_EQ(config.target_model.model_id, "big");
    EXPECT_EQ(config.target_model.vocab_size, 32u);
    EXPECT_EQ(config.target_model.peak_token, 3);
    EXPECT_FLOAT_EQ(config.target_model.peak_logit, 5.0f);
    EXPECT_EQ(config.draft_model.seed, 9u);
    EXPECT_TRUE(config.verbose);
}

TEST_F(ConfigFileTest, DefaultsWhenSectionsAreMissing) {
    Config config(write("workspace.json", "{}"));
    EXPECT_EQ(config.speculative_config.draft_length, 4u);
    EXPECT_EQ(config.speculative_config.residual_fallback, ResidualFallback::Target);
    EXPECT_EQ(config.target_model.arch, "uniform_noise");
    EXPECT_EQ(config.target_model.vocab_size, 10u);
    EXPECT_FALSE(config.verbose);
}

TEST_F(ConfigFileTest, ModelEntryMayNameAFile) {
    write("draft.json", R"({"arch": "peaked", "vocab_size": 16, "peak_token": 2, "floor_logit": "-inf"})");
    Config config(write("workspace.json", R"({"model_draft": "draft.json"})"));

    EXPECT_EQ(config.draft_model.arch, "peaked");
    EXPECT_EQ(config.draft_model.vocab_size, 16u);
    EXPECT_TRUE(std::isinf(config.draft_model.floor_logit));
    EXPECT_LT(config.draft_model.floor_logit, 0.0f);
}

TEST_F(ConfigFileTest, SpeculativeTemperatureIsAdopted) {
    Config config(write("workspace.json", R"({"speculative": {"temperature": 1.5}})"));
    EXPECT_FLOAT_EQ(config.sampler_config.temperature, 1.5f);
    EXPECT_FLOAT_EQ(config.speculative_config.temperature, 1.5f);
}

TEST_F(ConfigFileTest, RejectsBadFiles) {
    EXPECT_THROW(Config(m_dir / "missing.json"), ConfigException);
    EXPECT_THROW(Config(write("broken.json", "{\"sampler\": ")), ConfigException);
    EXPECT_THROW(
        Config(write("fallback.json", R"({"speculative": {"residual_fallback": "uniform"}})")), ConfigException
    );
    EXPECT_THROW(
        Config(write("temperature.json", R"({"sampler": {"temperature": 0.5}, "speculative": {"temperature": 0.9}})")),
        ConfigException
    );
    EXPECT_THROW(Config(write("types.json", R"({"speculative": {"draft_length": "four"}})")), ConfigException);
    EXPECT_THROW(Config(write("logit.json", R"({"model_target": {"floor_logit": "-infinity"}})")), ConfigException);
}

TEST_F(ConfigFileTest, RejectsOutOfRangeIntegers) {
    auto negative_draft = write("negative_draft.json", R"({"speculative": {"draft_length": -1}})");
    EXPECT_THROW(Config{negative_draft}, ConfigException);

    auto zero_draft = write("zero_draft.json", R"({"speculative": {"draft_length": 0}})");
    EXPECT_THROW(Config{zero_draft}, ConfigException);

    auto negative_vocab = write("negative_vocab.json", R"({"model_target": {"vocab_size": -3}})");
    EXPECT_THROW(Config{negative_vocab}, ConfigException);

    auto zero_vocab = write("zero_vocab.json", R"({"model_draft": {"vocab_size": 0}})");
    EXPECT_THROW(Config{zero_vocab}, ConfigException);

    auto huge_vocab = write("huge_vocab.json", R"({"model_draft": {"vocab_size": 5000000000}})");
    EXPECT_THROW(Config{huge_vocab}, ConfigException);

    auto negative_peak = write("negative_peak.json", R"({"model_target": {"arch": "peaked", "peak_token": -2}})");
    EXPECT_THROW(Config{negative_peak}, ConfigException);

    auto negative_top_k = write("negative_top_k.json", R"({"sampler": {"top_k": -5}})");
    EXPECT_THROW(Config{negative_top_k}, ConfigException);

    auto model_file = write("model.json", R"({"vocab_size": -1})");
    EXPECT_THROW(ModelConfig{model_file}, ConfigException);
}

TEST_F(ConfigFileTest, NegativeSeedMeansRandom) {
    Config config(write("workspace.json", R"({"sampler": {"seed": -1}, "model_draft": {"seed": 7}})"));
    EXPECT_EQ(config.sampler_config.seed, static_cast<uint64_t>(-1));
    EXPECT_EQ(config.draft_model.seed, 7u);
}

TEST(ModelLoader, DispatchesOnArch) {
    ModelConfig config;
    config.arch       = "peaked";
    config.vocab_size = 4;
    config.peak_token = 2;

    auto model = load_model(config);
    EXPECT_EQ(model->vocab_size(), 4u);
    EXPECT_EQ(model->name(), "peaked");

    config.model_id = "sharp";
    EXPECT_EQ(load_model(config)->name(), "sharp");
}

TEST(ModelLoader, RejectsInvalidConfigs) {
    ModelConfig unknown;
    unknown.arch = "transformer";
    EXPECT_THROW(load_model(unknown), ConfigException);

    ModelConfig empty_vocab;
    empty_vocab.vocab_size = 0;
    EXPECT_THROW(load_model(empty_vocab), ConfigException);

    ModelConfig bad_peak;
    bad_peak.arch       = "peaked";
    bad_peak.vocab_size = 4;
    bad_peak.peak_token = 4;
    EXPECT_THROW(load_model(bad_peak), ConfigException);
}

TEST(ResidualFallback, ParsesNames) {
    EXPECT_EQ(parse_residual_fallback("target"), ResidualFallback::Target);
    EXPECT_EQ(parse_residual_fallback("error"), ResidualFallback::Error);
    EXPECT_EQ(to_string(ResidualFallback::Error), "error");
    EXPECT_THROW(parse_residual_fallback("Target"), ConfigException);
}

TEST(CommandLine, ParsesPromptTokens) {
    EXPECT_EQ(parse_prompt_tokens("1,2,3,4,5"), (TokenSequence{1, 2, 3, 4, 5}));
    EXPECT_EQ(parse_prompt_tokens(" 7 , 0,12 "), (TokenSequence{7, 0, 12}));
    EXPECT_EQ(parse_prompt_tokens("3,,4"), (TokenSequence{3, 4}));
    EXPECT_TRUE(parse_prompt_tokens("").empty());

    EXPECT_THROW(parse_prompt_tokens("1,x,3"), ConfigException);
    EXPECT_THROW(parse_prompt_tokens("1,-2"), ConfigException);
    EXPECT_THROW(parse_prompt_tokens("4.5"), ConfigException);
}

TEST(CommandLine, PromptWithNonAsciiBytesIsRejected) {
    EXPECT_EQ(parse_prompt_tokens("\t1 ,\n2"), (TokenSequence{1, 2}));
    EXPECT_THROW(parse_prompt_tokens("1,\xC3\xA9"), ConfigException);
    EXPECT_THROW(parse_prompt_tokens("\xA0" "3"), ConfigException);
}

TEST(CommandLine, ZeroDraftLengthIsRejected) {
    std::string program = "specdec-run";
    std::string flag    = "-k";
    std::string value   = "0";
    char *argv[]        = {program.data(), flag.data(), value.data()};

    auto args = parse_command_line("SpecDec CLI", 3, argv);
    ASSERT_TRUE(args.draft_length.has_value());
    EXPECT_EQ(*args.draft_length, 0);
    EXPECT_THROW(get_config_from_argument(args), ConfigException);
}

TEST(CommandLine, OutOfRangeOverridesAreRejected) {
    CommandLineArgument negative_draft;
    negative_draft.draft_length = -1;
    EXPECT_THROW(get_config_from_argument(negative_draft), ConfigException);

    CommandLineArgument zero_vocab;
    zero_vocab.vocab_size = 0;
    EXPECT_THROW(get_config_from_argument(zero_vocab), ConfigException);

    CommandLineArgument negative_vocab;
    negative_vocab.vocab_size = -3;
    EXPECT_THROW(get_config_from_argument(negative_vocab), ConfigException);
}

TEST(CommandLine, DefaultConfigWithoutFile) {
    CommandLineArgument args;
    auto config = get_config_from_argument(args);

    EXPECT_EQ(config.target_model.model_id, "target");
    EXPECT_EQ(config.draft_model.model_id, "draft");
    EXPECT_NE(config.target_model.seed, config.draft_model.seed);
    EXPECT_EQ(config.speculative_config.draft_length, 4u);
    EXPECT_EQ(config.target_model.vocab_size, 10u);
}

TEST(CommandLine, OverridesApplyToBothSections) {
    CommandLineArgument args;
    args.draft_length      = 7;
    args.seed              = 123;
    args.temperature       = 0.5f;
    args.vocab_size        = 64;
    args.residual_fallback = "error";
    args.verbose           = true;

    auto config = get_config_from_argument(args);
    EXPECT_EQ(config.speculative_config.draft_length, 7u);
    EXPECT_EQ(config.sampler_config.seed, 123u);
    EXPECT_FLOAT_EQ(config.sampler_config.temperature, 0.5f);
    EXPECT_FLOAT_EQ(config.speculative_config.temperature, 0.5f);
    EXPECT_EQ(config.target_model.vocab_size, 64u);
    EXPECT_EQ(config.draft_model.vocab_size, 64u);
    EXPECT_EQ(config.speculative_config.residual_fallback, ResidualFallback::Error);
    EXPECT_TRUE(config.verbose);
}

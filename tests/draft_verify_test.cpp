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

#include "core/exception.hpp"
#include "model/peaked/peaked_model.hpp"
#include "model/uniform_noise/uniform_noise_model.hpp"
#include "sampler/sampler_chain.hpp"
#include "speculative/draft_sampler.hpp"
#include "speculative/verifier.hpp"
#include "test_models.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <stdexcept>
#include <vector>

using namespace specdec;

namespace {

void expect_rows_equal(std::span<const float> a, std::span<const float> b) {
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_FLOAT_EQ(a[i], b[i]) << "index " << i;
    }
}

} // namespace

TEST(DraftSampler, CallsModelOncePerSpeculativeToken) {
    auto inner   = std::make_shared<test::CausalHashModel>(16, 5);
    auto counter = std::make_shared<test::CountingModel>(inner);
    RandomSource random(1);
    SamplerChain sampler(SamplerConfig{}, random);

    TokenSequence prompt = {3, 1, 4};
    auto result          = DraftSampler(counter, sampler).draft(prompt, 4);

    EXPECT_EQ(counter->m_input_lengths, (std::vector<size_t>{3, 4, 5, 6}));
    ASSERT_EQ(result.tokens.size(), 7u);
    EXPECT_EQ(TokenSequence(result.tokens.begin(), result.tokens.begin() + 3), prompt);
    EXPECT_EQ(result.logits.batch(), 1u);
    EXPECT_EQ(result.logits.n_positions(), 4u);
    EXPECT_EQ(result.logits.n_vocab(), 16u);
    for (auto token : result.tokens) {
        EXPECT_GE(token, 0);
        EXPECT_LT(token, 16);
    }
}

TEST(DraftSampler, RowsComeFromTheGrowingPrefix) {
    auto model = std::make_shared<test::CausalHashModel>(12, 9);
    RandomSource random(4);
    SamplerChain sampler(SamplerConfig{}, random);

    TokenSequence prompt = {2, 7};
    auto result          = DraftSampler(model, sampler).draft(prompt, 3);

    for (size_t t = 0; t < 3; t++) {
        TokenSequence prefix(result.tokens.begin(), result.tokens.begin() + prompt.size() + t);
        auto expected = model->forward(prefix);
        expect_rows_equal(result.logits.row(t), expected.row(prefix.size() - 1));
    }
}

TEST(DraftSampler, GreedyFollowsPeak) {
    auto config        = test::make_model_config(8, "peaked");
    config->peak_token = 5;
    auto model         = std::make_shared<PeakedModel>(config);

    RandomSource random(1);
    SamplerConfig greedy;
    greedy.greedy = true;
    SamplerChain sampler(greedy, random);

    auto result = DraftSampler(model, sampler).draft({0}, 3);
    EXPECT_EQ(result.tokens, (TokenSequence{0, 5, 5, 5}));
}

TEST(DraftSampler, RejectsBadArguments) {
    auto model = std::make_shared<test::CausalHashModel>(4, 1);
    RandomSource random(1);
    SamplerChain sampler(SamplerConfig{}, random);
    DraftSampler drafter(model, sampler);

    EXPECT_THROW(drafter.draft({1, 2}, 0), PreconditionException);
    EXPECT_THROW(drafter.draft({}, 2), PreconditionException);
}

TEST(DraftSampler, ModelErrorsPropagate) {
    RandomSource random(1);
    SamplerChain sampler(SamplerConfig{}, random);

    auto throwing = std::make_shared<test::ThrowingModel>(4);
    EXPECT_THROW(DraftSampler(throwing, sampler).draft({1}, 2), std::runtime_error);

    auto short_output = std::make_shared<test::ShortOutputModel>(4);
    EXPECT_THROW(DraftSampler(short_output, sampler).draft({1, 2}, 2), ModuleException);
}

TEST(Verifier, SingleForwardOverFullSequence) {
    auto inner   = std::make_shared<test::CausalHashModel>(10, 3);
    auto counter = std::make_shared<test::CountingModel>(inner);

    TokenSequence tokens = {1, 2, 3, 4, 5, 6, 7};
    auto logits          = Verifier(counter).verify(tokens, 4);

    EXPECT_EQ(counter->m_input_lengths, std::vector<size_t>{7});
    ASSERT_EQ(logits.n_positions(), 5u);
    ASSERT_EQ(logits.n_vocab(), 10u);

    auto full = inner->forward(tokens);
    for (size_t t = 0; t < 5; t++) {
        expect_rows_equal(logits.row(t), full.row(2 + t));
    }
}

TEST(Verifier, RejectsBadArguments) {
    auto model = std::make_shared<test::CausalHashModel>(4, 1);
    Verifier verifier(model);

    EXPECT_THROW(verifier.verify({1, 2, 3}, 0), PreconditionException);
    EXPECT_THROW(verifier.verify({1, 2, 3}, 3), PreconditionException);
}

TEST(Verifier, ModelErrorsPropagate) {
    auto throwing = std::make_shared<test::ThrowingModel>(4);
    EXPECT_THROW(Verifier(throwing).verify({1, 2, 3}, 2), std::runtime_error);

    auto short_output = std::make_shared<test::ShortOutputModel>(4);
    EXPECT_THROW(Verifier(short_output).verify({1, 2, 3}, 2), ModuleException);
}

TEST(UniformNoiseModel, LogitsInUnitRange) {
    auto config  = test::make_model_config(10, "uniform_noise");
    config->seed = 17;
    UniformNoiseModel model(config);

    auto logits = model.forward({1, 2, 3, 4});
    EXPECT_EQ(logits.batch(), 1u);
    EXPECT_EQ(logits.n_positions(), 4u);
    EXPECT_EQ(logits.n_vocab(), 10u);
    for (float value : logits.m_data) {
        EXPECT_GE(value, -1.0f);
        EXPECT_LE(value, 1.0f);
    }
}

TEST(UniformNoiseModel, SameSeedSameStream) {
    auto config  = test::make_model_config(6, "uniform_noise");
    config->seed = 3;
    UniformNoiseModel a(config);
    UniformNoiseModel b(config);

    EXPECT_EQ(a.forward({1, 2}).m_data, b.forward({1, 2}).m_data);
}

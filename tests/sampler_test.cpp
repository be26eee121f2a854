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
#include "sampler/prob_array.hpp"
#include "sampler/sampler_chain.hpp"
#include "test_models.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace specdec;

TEST(ProbArray, SoftmaxSortsAndNormalizes) {
    std::vector<float> logits = {1.0f, 3.0f, 2.0f};
    ProbArray probs(logits);
    probs.softmax();

    EXPECT_TRUE(probs.m_is_sorted);
    EXPECT_TRUE(probs.m_is_normalized);
    EXPECT_EQ(probs[0].token, 1);
    EXPECT_EQ(probs[1].token, 2);
    EXPECT_EQ(probs[2].token, 0);

    float sum = 0.0f;
    for (auto &p : probs) {
        sum += p.prob;
    }
    EXPECT_NEAR(sum, 1.0f, 1e-6);
}

TEST(ProbArray, NormalizeRejectsZeroMass) {
    std::vector<float> zeros = {0.0f, 0.0f};
    ProbArray probs(zeros);
    EXPECT_THROW(probs.normalize(), DistributionException);

    std::vector<float> weights = {1.0f, 3.0f};
    ProbArray scaled(weights);
    scaled.normalize();
    EXPECT_FLOAT_EQ(scaled[0].prob, 0.25f);
    EXPECT_FLOAT_EQ(scaled[1].prob, 0.75f);
}

TEST(ProbArray, FromDistributionSamplesOnlySupport) {
    std::vector<float> dist = {0.0f, 0.0f, 1.0f, 0.0f};
    RandomSource random(5);
    for (int i = 0; i < 50; i++) {
        auto probs = ProbArray::from_distribution(dist);
        EXPECT_EQ(probs.stochastic_sample(random.engine()).token, 2);
    }
}

TEST(Sampler, TopKKeepsLargest) {
    std::vector<float> logits = {0.1f, 5.0f, 0.3f, 4.0f, -2.0f};
    ProbArray probs(logits);
    TopKSampler(2).apply(probs);

    ASSERT_EQ(probs.size(), 2u);
    EXPECT_EQ(probs[0].token, 1);
    EXPECT_EQ(probs[1].token, 3);
    EXPECT_FALSE(probs.m_is_normalized);
}

TEST(Sampler, TopPCutsTail) {
    std::vector<float> dist = {0.5f, 0.3f, 0.15f, 0.05f};
    auto probs        = ProbArray::from_distribution(dist);
    probs.m_is_sorted = true;
    TopPSampler(0.75f).apply(probs);

    ASSERT_EQ(probs.size(), 2u);
    EXPECT_EQ(probs[0].token, 0);
    EXPECT_EQ(probs[1].token, 1);
}

TEST(Sampler, TemperatureRejectsNonPositive) {
    std::vector<float> logits = {1.0f, 2.0f};
    ProbArray probs(logits);
    EXPECT_THROW(TemperatureSampler(0.0f).apply(probs), PreconditionException);
}

TEST(SamplerChain, BuildsFromConfig) {
    RandomSource random(1);

    SamplerConfig plain;
    EXPECT_EQ(SamplerChain(plain, random).size(), 5u);

    SamplerConfig with_top_k;
    with_top_k.top_k = 3;
    EXPECT_EQ(SamplerChain(with_top_k, random).size(), 6u);

    SamplerConfig greedy;
    greedy.greedy = true;
    EXPECT_EQ(SamplerChain(greedy, random).size(), 1u);
}

TEST(SamplerChain, GreedyPicksArgmax) {
    RandomSource random(1);
    SamplerConfig config;
    config.greedy = true;
    SamplerChain chain(config, random);

    std::vector<float> logits = {0.2f, -1.0f, 7.5f, 7.0f};
    EXPECT_EQ(sample_token(chain, logits), 2);
}

TEST(SamplerChain, SameSeedSameTokens) {
    std::vector<float> logits = {0.5f, 0.1f, 0.9f, -0.3f, 0.0f, 0.4f};
    auto run = [&](uint64_t seed) {
        RandomSource random(seed);
        SamplerChain chain(SamplerConfig{}, random);
        TokenSequence tokens;
        for (int i = 0; i < 64; i++) {
            tokens.push_back(sample_token(chain, logits));
        }
        return tokens;
    };

    EXPECT_EQ(run(42), run(42));
    EXPECT_NE(run(42), run(43));
}

TEST(SamplerChain, OneHotAlwaysSampled) {
    RandomSource random(9);
    SamplerChain chain(SamplerConfig{}, random);
    auto logits = test::one_hot_logits(10, 7);
    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(sample_token(chain, logits), 7);
    }
}

TEST(SamplerChain, MatchesDistributionFrequencies) {
    RandomSource random(2024);
    SamplerChain chain(SamplerConfig{}, random);
    std::vector<float> logits = {std::log(0.2f), std::log(0.8f)};

    const int n_trials = 20000;
    int n_ones         = 0;
    for (int i = 0; i < n_trials; i++) {
        n_ones += sample_token(chain, logits) == 1;
    }
    EXPECT_NEAR(static_cast<double>(n_ones) / n_trials, 0.8, 0.02);
}

TEST(SampleToken, RequiresSingleCandidate) {
    SamplerChain chain;
    chain.append<SoftmaxSampler>();
    std::vector<float> logits = {1.0f, 2.0f};
    EXPECT_THROW(sample_token(chain, logits), ModuleException);
}

TEST(SampleToken, RejectsInvalidLogits) {
    RandomSource random(1);
    SamplerChain chain(SamplerConfig{}, random);
    std::vector<float> logits = {NAN, 1.0f};
    EXPECT_THROW(sample_token(chain, logits), DistributionException);
}

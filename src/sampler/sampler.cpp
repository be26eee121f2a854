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

#include "sampler/sampler.hpp"

#include "core/exception.hpp"
#include "sampler/temperature_distribution.hpp"

#include <algorithm>
#include <functional>

namespace specdec {

void TemperatureSampler::apply(ProbArray &probs) {
    SPECDEC_ASSERT_PRECONDITION(
        m_temperature > 0, "TemperatureSampler", "temperature must be > 0, got {}", m_temperature
    );

    if (m_temperature != 1) {
        for (auto &prob : probs.m_probs) {
            prob.prob /= m_temperature;
        }

        probs.m_is_normalized = false;
    }
}

void SoftmaxSampler::apply(ProbArray &probs) {
    probs.softmax();
}

void NormalizeSampler::apply(ProbArray &probs) {
    probs.normalize();
}

void TopKSampler::apply(ProbArray &probs) {
    SPECDEC_ASSERT(m_topk > 0);
    auto k = std::min(m_topk, probs.m_probs.size());

    // Sort scores in descending order
    if (!probs.m_is_sorted) {
        std::partial_sort(
            probs.m_probs.begin(), probs.m_probs.begin() + k, probs.m_probs.end(), std::greater<ProbIndex>{}
        );
        probs.m_is_sorted = true;
    }

    if (k != probs.m_probs.size()) {
        probs.m_is_normalized = false;
    }

    probs.m_probs.resize(k);
}

void TopPSampler::apply(ProbArray &probs) {
    if (m_topp >= 1.0f) {
        return;
    }
    SPECDEC_ASSERT(probs.m_is_normalized);
    SPECDEC_ASSERT(probs.m_is_sorted);

    float cum_sum   = 0.0f;
    size_t last_idx = probs.m_probs.size();

    for (size_t i = 0; i < probs.m_probs.size(); ++i) {
        cum_sum += probs.m_probs[i].prob;

        // The current candidate is kept, hence i + 1.
        if (cum_sum >= m_topp && i + 1 >= m_min_keep) {
            last_idx = i + 1;
            break;
        }
    }

    if (last_idx != probs.m_probs.size()) {
        probs.m_is_normalized = false;
    }

    probs.m_probs.resize(last_idx);
}

void StochasticSampler::apply(ProbArray &probs) {
    probs.normalize();
    probs[0] = probs.stochastic_sample(m_random.engine());

    probs.resize(1);
    probs[0].prob         = 1.0f;
    probs.m_is_sorted     = true;
    probs.m_is_normalized = true;
}

void GreedySampler::apply(ProbArray &probs) {
    probs[0] = probs.greedy_sample();

    probs.resize(1);
    probs[0].prob         = 1.0f;
    probs.m_is_sorted     = true;
    probs.m_is_normalized = true;
}

auto sample_token(Sampler &sampler, std::span<const float> logits) -> Token {
    check_logits(logits, "sample_token");

    ProbArray probs(logits);
    sampler.apply(probs);
    SPECDEC_ASSERT_MODULE(
        probs.size() == 1, "sample_token", "sampler", "sampler left {} candidates instead of one", probs.size()
    );

    auto token = probs[0].token;
    sampler.accept(token);
    return token;
}

} // namespace specdec

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

#include "sampler/sampler_chain.hpp"

#include "core/logger.hpp"

namespace specdec {

void SamplerChain::build_from_config(const SamplerConfig &config, RandomSource &random) {
    if (config.greedy) {
        append<GreedySampler>();
        return;
    }

    // Samplers in order:
    // - Top K
    // - Temperature
    // - Softmax
    // - Top P
    // - Normalize
    // - Stochastic

    if (config.top_k > 0) {
        append<TopKSampler>(config.top_k);
    }
    append<TemperatureSampler>(config.temperature);
    append<SoftmaxSampler>();
    append<TopPSampler>(config.top_p);
    append<NormalizeSampler>();
    append<StochasticSampler>(random);

    SPECDEC_LOG_DEBUG(
        "sampler chain: top_k={} temperature={} top_p={} seed={}",
        config.top_k,
        config.temperature,
        config.top_p,
        random.seed()
    );
}

void SamplerChain::apply(ProbArray &probs) {
    for (auto &sampler : m_samplers) {
        sampler->apply(probs);
    }
}

void SamplerChain::accept(Token token) {
    for (auto &sampler : m_samplers) {
        sampler->accept(token);
    }
}

} // namespace specdec

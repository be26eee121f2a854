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
#include "core/random.hpp"
#include "sampler/sampler.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace specdec {

struct SamplerChain final : Sampler {
    virtual ~SamplerChain() override = default;

    SamplerChain() = default;

    SamplerChain(const SamplerConfig &config, RandomSource &random) {
        build_from_config(config, random);
    }

    template <typename SamplerType, typename... Args>
    void append(Args &&...args) {
        m_samplers.emplace_back(std::make_unique<SamplerType>(std::forward<Args>(args)...));
    }

    void build_from_config(const SamplerConfig &config, RandomSource &random);

    void apply(ProbArray &probs) override;
    void accept(Token token) override;

    auto size() const -> size_t {
        return m_samplers.size();
    }

private:
    std::vector<std::unique_ptr<Sampler>> m_samplers;
};

} // namespace specdec

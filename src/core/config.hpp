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

#include "core/typedefs.hpp"
#include "speculative/speculative_config.hpp"

#include <cstdint>
#include <string>

namespace specdec {

const std::string SAMPLER_KEY      = "sampler";
const std::string SPECULATIVE_KEY  = "speculative";
const std::string TARGET_MODEL_KEY = "model_target";
const std::string DRAFT_MODEL_KEY  = "model_draft";
const std::string VERBOSE_KEY      = "verbose";

struct SamplerConfig {
    uint64_t seed     = -1; // -1 = randomly choose a new seed
    float temperature = 1.00f;
    float top_p       = 1.00f; // 1.0 = disabled
    size_t top_k      = 0;     // 0 = disabled
    bool greedy       = false;

    SamplerConfig() = default;
    SamplerConfig(const Path &sampler_config_file);

    ~SamplerConfig() noexcept = default;

    // Anything other than plain temperature sampling breaks exact speculative sampling.
    bool is_exact() const {
        return !greedy && top_k == 0 && top_p >= 1.0f;
    }
};

struct ModelConfig {
    std::string arch     = "uniform_noise"; // uniform_noise | peaked
    std::string model_id = "";
    uint32_t vocab_size  = 10;
    uint64_t seed        = 0;

    // peaked only
    Token peak_token  = 0;
    float peak_logit  = 10.0f;
    float floor_logit = 0.0f;

    ModelConfig() = default;
    ModelConfig(const Path &model_config_file);

    ~ModelConfig() noexcept = default;
};

struct Config {
public:
    SamplerConfig sampler_config;
    SpeculativeConfig speculative_config;
    ModelConfig target_model;
    ModelConfig draft_model;
    bool verbose = false;

public:
    Config() = default;

    Config(const Path &workspace_config_path);

    ~Config() noexcept = default;
};

} // namespace specdec

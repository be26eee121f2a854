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

#include "core/config.hpp"

#include "core/exception.hpp"
#include "core/typedefs.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

namespace specdec {

namespace {

void read_sampler_config(const nlohmann::json &j, SamplerConfig &config) {
    config.seed        = static_cast<uint64_t>(j.value("seed", static_cast<int64_t>(config.seed)));
    config.temperature = j.value("temperature", config.temperature);
    config.top_p       = j.value("top_p", config.top_p);
    config.greedy      = j.value("greedy", config.greedy);

    const int64_t top_k = j.value("top_k", static_cast<int64_t>(config.top_k));
    SPECDEC_ASSERT_CONFIG(top_k >= 0, "SamplerConfig", "top_k must be >= 0, got {}", top_k);
    config.top_k = static_cast<size_t>(top_k);
}

// JSON has no infinities, so "-inf" is accepted as a string.
auto read_logit(const nlohmann::json &j, const std::string &key, float default_value) -> float {
    if (!j.contains(key)) {
        return default_value;
    }
    auto &value = j.at(key);
    if (value.is_string()) {
        auto text = value.get<std::string>();
        SPECDEC_ASSERT_CONFIG(text == "-inf", "ModelConfig", "{} must be a number or \"-inf\", got {:?}", key, text);
        return -std::numeric_limits<float>::infinity();
    }
    return value.get<float>();
}

void read_model_config(const nlohmann::json &j, ModelConfig &config) {
    config.arch        = j.value("arch", config.arch);
    config.model_id    = j.value("model_id", config.model_id);
    config.seed        = static_cast<uint64_t>(j.value("seed", static_cast<int64_t>(config.seed)));

    // Read as signed, nlohmann casts negative integers to unsigned targets without complaint.
    const int64_t vocab_size = j.value("vocab_size", static_cast<int64_t>(config.vocab_size));
    SPECDEC_ASSERT_CONFIG(
        vocab_size >= 1 && vocab_size <= std::numeric_limits<uint32_t>::max(),
        "ModelConfig",
        "vocab_size must be in [1, {}], got {}",
        std::numeric_limits<uint32_t>::max(),
        vocab_size
    );
    config.vocab_size = static_cast<uint32_t>(vocab_size);

    const int64_t peak_token = j.value("peak_token", static_cast<int64_t>(config.peak_token));
    SPECDEC_ASSERT_CONFIG(
        peak_token >= 0 && peak_token < vocab_size,
        "ModelConfig",
        "peak_token {} outside vocabulary of size {}",
        peak_token,
        vocab_size
    );
    config.peak_token = static_cast<Token>(peak_token);

    config.peak_logit  = read_logit(j, "peak_logit", config.peak_logit);
    config.floor_logit = read_logit(j, "floor_logit", config.floor_logit);
}

void read_speculative_config(const nlohmann::json &j, SpeculativeConfig &config) {
    const int64_t draft_length = j.value("draft_length", static_cast<int64_t>(config.draft_length));
    SPECDEC_ASSERT_CONFIG(draft_length >= 1, "SpeculativeConfig", "draft_length must be >= 1, got {}", draft_length);
    config.draft_length = static_cast<size_t>(draft_length);

    config.temperature  = j.value("temperature", config.temperature);
    if (j.contains("residual_fallback")) {
        config.residual_fallback = parse_residual_fallback(j.at("residual_fallback").get<std::string>());
    }
}

auto read_json_file(const Path &path, const std::string_view tag) -> nlohmann::json {
    std::ifstream file(path);
    SPECDEC_ASSERT_CONFIG(file.good(), tag, "failed to open config file {}", path);

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception &err) {
        throw ConfigException(tag, fmt::format("failed parsing config file {}:\n{}", path, err.what()));
    }
    return j;
}

} // namespace

SamplerConfig::SamplerConfig(const Path &sampler_config_file) {
    auto j = read_json_file(sampler_config_file, "SamplerConfig");
    try {
        read_sampler_config(j, *this);
    } catch (const nlohmann::json::exception &err) {
        throw ConfigException(
            "SamplerConfig", fmt::format("invalid sampler config file {}:\n{}", sampler_config_file, err.what())
        );
    }
}

ModelConfig::ModelConfig(const Path &model_config_file) {
    auto j = read_json_file(model_config_file, "ModelConfig");
    try {
        read_model_config(j, *this);
    } catch (const nlohmann::json::exception &err) {
        throw ConfigException(
            "ModelConfig", fmt::format("invalid model config file {}:\n{}", model_config_file, err.what())
        );
    }
}

Config::Config(const Path &workspace_config_path) {
    auto j = read_json_file(workspace_config_path, "Config");
    const Path work_folder = workspace_config_path.parent_path();

    // A model entry is either an inline object or a file name relative to the workspace file.
    auto read_model_entry = [&](const std::string &key, ModelConfig &model) {
        if (!j.contains(key)) {
            return;
        }
        auto &entry = j.at(key);
        if (entry.is_string()) {
            model = ModelConfig(work_folder / entry.get<std::string>());
        } else {
            read_model_config(entry, model);
        }
    };

    try {
        if (j.contains(SAMPLER_KEY)) {
            read_sampler_config(j.at(SAMPLER_KEY), sampler_config);
        }
        if (j.contains(SPECULATIVE_KEY)) {
            read_speculative_config(j.at(SPECULATIVE_KEY), speculative_config);
        }

        // The acceptance test and the draft sampler must agree on the temperature.
        const bool sampler_sets = j.contains(SAMPLER_KEY) && j.at(SAMPLER_KEY).contains("temperature");
        const bool spec_sets    = j.contains(SPECULATIVE_KEY) && j.at(SPECULATIVE_KEY).contains("temperature");
        if (spec_sets && !sampler_sets) {
            sampler_config.temperature = speculative_config.temperature;
        } else if (!spec_sets) {
            speculative_config.temperature = sampler_config.temperature;
        }
        SPECDEC_ASSERT_CONFIG(
            speculative_config.temperature == sampler_config.temperature,
            "Config",
            "speculative temperature {} differs from sampler temperature {}",
            speculative_config.temperature,
            sampler_config.temperature
        );

        read_model_entry(TARGET_MODEL_KEY, target_model);
        read_model_entry(DRAFT_MODEL_KEY, draft_model);
        verbose = j.value(VERBOSE_KEY, verbose);
    } catch (const nlohmann::json::exception &err) {
        throw ConfigException(
            "Config", fmt::format("invalid workspace config file {}:\n{}", workspace_config_path, err.what())
        );
    }
}

} // namespace specdec

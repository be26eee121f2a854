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

#include "model/model_loader.hpp"

#include "core/exception.hpp"
#include "core/logger.hpp"
#include "model/peaked/peaked_model.hpp"
#include "model/uniform_noise/uniform_noise_model.hpp"

namespace specdec {

auto load_model(const ModelConfig &config) -> std::shared_ptr<Model> {
    SPECDEC_ASSERT_CONFIG(config.vocab_size > 0, "load_model", "vocab_size must be > 0");

    std::shared_ptr<Model> out_model;
    auto out_config = std::make_shared<ModelConfig>(config);

    auto arch = out_config->arch;
    if (arch == "uniform_noise") {
        out_model = std::make_shared<UniformNoiseModel>(out_config);
    } else if (arch == "peaked") {
        out_model = std::make_shared<PeakedModel>(out_config);
    } else {
        throw ConfigException("load_model", fmt::format("unknown model arch: {}", arch));
    }

    SPECDEC_LOG_INFO("Load model {} (vocab {}) ...", out_model->name(), out_model->vocab_size());
    return out_model;
}

} // namespace specdec

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

#include "sampler/temperature_distribution.hpp"

#include "core/exception.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace specdec {

namespace {

// Writes softmax(logits / temperature) to `out`. Inputs must have passed check_logits().
void softmax_row(std::span<const float> logits, float temperature, std::span<float> out) {
    const float max_logit = *std::max_element(logits.begin(), logits.end());

    // (l - max) / T is <= 0, so exp() never overflows.
    double sum = 0.0;
    for (size_t i = 0; i < logits.size(); i++) {
        out[i] = std::exp((logits[i] - max_logit) / temperature);
        sum += out[i];
    }

    for (auto &p : out) {
        p = static_cast<float>(p / sum);
    }
}

} // namespace

void check_logits(std::span<const float> logits, std::string_view tag) {
    SPECDEC_ASSERT_DISTRIBUTION(!logits.empty(), tag, "empty logits row");

    bool has_finite = false;
    for (size_t i = 0; i < logits.size(); i++) {
        const float value = logits[i];
        SPECDEC_ASSERT_DISTRIBUTION(
            !std::isnan(value) && value != std::numeric_limits<float>::infinity(),
            tag,
            "non-finite logit {} for token {}",
            value,
            i
        );
        has_finite |= std::isfinite(value);
    }
    SPECDEC_ASSERT_DISTRIBUTION(has_finite, tag, "every logit of the row is -inf");
}

auto temperature_distribution(std::span<const float> logits, float temperature) -> std::vector<float> {
    SPECDEC_ASSERT_PRECONDITION(
        temperature > 0, "TemperatureDistribution", "temperature must be > 0, got {}", temperature
    );
    check_logits(logits, "TemperatureDistribution");

    std::vector<float> probs(logits.size());
    softmax_row(logits, temperature, probs);
    return probs;
}

auto temperature_distribution(const LogitsTensor &logits, float temperature) -> LogitsTensor {
    SPECDEC_ASSERT_PRECONDITION(
        temperature > 0, "TemperatureDistribution", "temperature must be > 0, got {}", temperature
    );

    LogitsTensor probs(logits.batch(), logits.n_positions(), logits.n_vocab());
    for (size_t b = 0; b < logits.batch(); b++) {
        for (size_t pos = 0; pos < logits.n_positions(); pos++) {
            auto row = logits.row(pos, b);
            check_logits(row, "TemperatureDistribution");
            softmax_row(row, temperature, probs.row(pos, b));
        }
    }
    return probs;
}

} // namespace specdec

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

#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <vector>

namespace specdec {

///
/// @brief Dense float tensor indexed by (batch, position, vocab)
/// @note  Used both for raw logits and for normalized distributions. Rows are contiguous
/// along the vocabulary axis.
///
struct LogitsTensor {
public:
    using Shape = std::array<size_t, 3>; // {batch, positions, vocab}

    Shape m_shape = {0, 0, 0};
    std::vector<float> m_data;

public:
    LogitsTensor() = default;

    LogitsTensor(size_t batch, size_t n_positions, size_t n_vocab, float fill = 0.0f) :
        m_shape{batch, n_positions, n_vocab},
        m_data(batch * n_positions * n_vocab, fill) {}

public:
    size_t batch() const {
        return m_shape[0];
    }

    size_t n_positions() const {
        return m_shape[1];
    }

    size_t n_vocab() const {
        return m_shape[2];
    }

    bool empty() const {
        return m_data.empty();
    }

    auto row(size_t position, size_t b = 0) -> std::span<float> {
        SPECDEC_ASSERT(b < batch() && position < n_positions(), "row ({}, {}) out of {}", b, position, m_shape);
        return {m_data.data() + (b * n_positions() + position) * n_vocab(), n_vocab()};
    }

    auto row(size_t position, size_t b = 0) const -> std::span<const float> {
        SPECDEC_ASSERT(b < batch() && position < n_positions(), "row ({}, {}) out of {}", b, position, m_shape);
        return {m_data.data() + (b * n_positions() + position) * n_vocab(), n_vocab()};
    }

    auto at(size_t position, size_t token, size_t b = 0) const -> float {
        return row(position, b)[token];
    }

    // Copy of `count` consecutive positions starting at `first`, batch 0 only.
    auto slice_positions(size_t first, size_t count) const -> LogitsTensor {
        SPECDEC_ASSERT(first + count <= n_positions());
        LogitsTensor out(1, count, n_vocab());
        auto begin = m_data.begin() + first * n_vocab();
        std::copy(begin, begin + count * n_vocab(), out.m_data.begin());
        return out;
    }

    void append_row(std::span<const float> values) {
        if (empty()) {
            m_shape = {1, 0, values.size()};
        }
        SPECDEC_ASSERT(batch() == 1 && values.size() == n_vocab());
        m_data.insert(m_data.end(), values.begin(), values.end());
        m_shape[1] += 1;
    }
};

} // namespace specdec

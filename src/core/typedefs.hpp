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

#include <cstdint>
#include <filesystem>
#include <vector>

namespace specdec {

using Path  = std::filesystem::path;
using Token = int32_t;

// An ordered, append-only list of token ids.
using TokenSequence = std::vector<Token>;

static constexpr Token null_token = -1;

struct Noncopyable {
    Noncopyable(const Noncopyable &)    = delete;
    auto operator=(const Noncopyable &) = delete;

protected:
    Noncopyable()  = default;
    ~Noncopyable() = default;
};

} // namespace specdec

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

#include "speculative/speculative_config.hpp"

#include "core/exception.hpp"

namespace specdec {

auto parse_residual_fallback(std::string_view name) -> ResidualFallback {
    if (name == "target") {
        return ResidualFallback::Target;
    }
    if (name == "error") {
        return ResidualFallback::Error;
    }
    throw ConfigException(
        "SpeculativeConfig", fmt::format("unknown residual fallback {:?}, expected target|error", name)
    );
}

auto to_string(ResidualFallback fallback) -> std::string {
    switch (fallback) {
    case ResidualFallback::Target:
        return "target";
    case ResidualFallback::Error:
        return "error";
    }
    return "unknown";
}

} // namespace specdec

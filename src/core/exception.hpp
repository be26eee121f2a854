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

#include "fmt/core.h"
#include "fmt/format.h"
#include "fmt/std.h"

#include <exception>
#include <string>
#include <string_view>

namespace specdec {

#define SPECDEC_EXP_ASSERT(expr, Exception, ...)                                                                       \
    do {                                                                                                               \
        if (!(expr)) [[unlikely]] {                                                                                    \
            throw Exception(__VA_ARGS__);                                                                              \
        }                                                                                                              \
    } while (false)

class BasicException : public std::exception {
protected:
    /// Container for detailed exception message
    std::string m_content;

public:
    BasicException(const std::string_view tag, const std::string_view message) :
        m_content(fmt::format("[Exception][{}] BasicException: {}", tag, message)) {}

    ~BasicException() noexcept = default;

public:
    const char *what() const noexcept override {
        return m_content.c_str();
    }
};

///
/// @brief Exception caused by invalid config arguments
/// @note  Raised for unreadable or malformed workspace/model config files and for
/// option values that cannot be mapped (e.g. unknown model arch, unknown fallback policy).
///
class ConfigException final : public BasicException {
public:
    ConfigException(const std::string_view tag, const std::string_view message) :
        BasicException(tag, "ConfigException") {
        m_content += fmt::format("\n[Exception][{}] ConfigException: {}", tag, message);
    }

    ~ConfigException() noexcept = default;
};

#define SPECDEC_ASSERT_CONFIG(expr, tag, ...)                                                                          \
    SPECDEC_EXP_ASSERT(expr, ::specdec::ConfigException, tag, fmt::format("" __VA_ARGS__))

///
/// @brief Exception caused by a collaborator module (model, sampler) breaking its contract
/// @note  A model returning logits of the wrong shape ends up here. Exceptions thrown
/// by the collaborator itself are never wrapped.
///
class ModuleException final : public BasicException {
public:
    ModuleException(const std::string_view tag, const std::string_view module_name, const std::string_view message) :
        BasicException(tag, "ModuleException") {
        m_content += fmt::format("\n[Exception][{}] Module {}:", tag, module_name);
        m_content += fmt::format("\n[Exception][{}] ModuleException: {}", tag, message);
    }

    ~ModuleException() noexcept = default;
};

#define SPECDEC_ASSERT_MODULE(expr, tag, module, ...)                                                                  \
    SPECDEC_EXP_ASSERT(expr, ::specdec::ModuleException, tag, module, fmt::format("" __VA_ARGS__))

///
/// @brief Exception caused by a malformed probability distribution
/// @note  Non-finite logits, or a distribution whose total mass is zero where sampling
/// from it is required. Sampling from such input would silently produce garbage tokens.
///
class DistributionException final : public BasicException {
public:
    DistributionException(const std::string_view tag, const std::string_view message) :
        BasicException(tag, "DistributionException") {
        m_content += fmt::format("\n[Exception][{}] DistributionException: {}", tag, message);
    }

    ~DistributionException() noexcept = default;
};

#define SPECDEC_ASSERT_DISTRIBUTION(expr, tag, ...)                                                                    \
    SPECDEC_EXP_ASSERT(expr, ::specdec::DistributionException, tag, fmt::format("" __VA_ARGS__))

///
/// @brief Exception caused by invalid arguments to a generation call
/// @note  Always raised before any model is invoked.
///
class PreconditionException final : public BasicException {
public:
    PreconditionException(const std::string_view tag, const std::string_view message) :
        BasicException(tag, "PreconditionException") {
        m_content += fmt::format("\n[Exception][{}] PreconditionException: {}", tag, message);
    }

    ~PreconditionException() noexcept = default;
};

#define SPECDEC_ASSERT_PRECONDITION(expr, tag, ...)                                                                    \
    SPECDEC_EXP_ASSERT(expr, ::specdec::PreconditionException, tag, fmt::format("" __VA_ARGS__))

} // namespace specdec

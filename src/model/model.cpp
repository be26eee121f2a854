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

#include "model/model.hpp"

#include "core/exception.hpp"

namespace specdec {

void check_forward_output(const Model &model, const LogitsTensor &logits, size_t n_tokens) {
    SPECDEC_ASSERT_MODULE(
        logits.batch() == 1, "Model::forward", model.name(), "returned batch size {}, expected 1", logits.batch()
    );
    SPECDEC_ASSERT_MODULE(
        logits.n_positions() == n_tokens,
        "Model::forward",
        model.name(),
        "returned {} positions for {} input tokens",
        logits.n_positions(),
        n_tokens
    );
    SPECDEC_ASSERT_MODULE(
        logits.n_vocab() == model.vocab_size(),
        "Model::forward",
        model.name(),
        "returned {} logits per position, vocabulary size is {}",
        logits.n_vocab(),
        model.vocab_size()
    );
}

} // namespace specdec

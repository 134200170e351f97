// Copyright 2025 Siddhant Biradar
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

#include "partialjson/strict.hpp"

namespace partialjson {

using json = nlohmann::json;

bool is_json_complete(std::string_view text) {
    bool blank = true;
    for (char c : text) {
        if (!is_json_whitespace(c)) {
            blank = false;
            break;
        }
    }
    if (blank)
        return false;

    // accept() reports failure instead of throwing parse_error
    return json::accept(text.begin(), text.end());
}

std::optional<json> parse_complete(const CompletenessTracker &tracker, const std::string &path) {
    auto text = tracker.complete_text(path);
    if (!text)
        return std::nullopt;

    json value = json::parse(text->begin(), text->end(), nullptr, false);
    if (value.is_discarded())
        return std::nullopt;
    return value;
}

} // namespace partialjson

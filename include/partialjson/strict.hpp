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

#pragma once

#include "tracker.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace partialjson {

// Whole-document verdict from a strict parse: true only if text is one
// valid JSON value with nothing truncated. Empty or whitespace-only text is
// never complete. Does not throw.
bool is_json_complete(std::string_view text);

// Strictly parse the closed value at path from the tracker's last analysis.
// Empty when the path is not complete or its text is not valid JSON on its
// own (the tracker does not check escapes).
std::optional<nlohmann::json> parse_complete(const CompletenessTracker &tracker,
                                             const std::string &path);

} // namespace partialjson

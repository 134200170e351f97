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

#include "types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace partialjson {

// Everything recorded for one closed value
struct PathRecord {
    Span span;
    ValueKind kind = ValueKind::Object;
};

// Tracks which sub-structures of a (possibly truncated) JSON document are
// closed. Each analyze() re-scans the whole text and replaces the previous
// results; nothing is carried over between calls.
//
// Example:
//     CompletenessTracker tracker;
//     tracker.analyze(R"({"name": "Alice", "address": {"city": "NY)");
//     tracker.is_path_complete("");        // false
//     tracker.is_path_complete("name");    // true
//     tracker.is_path_complete("address"); // false
//
// Not safe for concurrent analyze() calls; use one tracker per document.
class CompletenessTracker {
public:

    CompletenessTracker() = default;

    // Scan text from offset 0. Never throws on malformed or truncated input.
    void analyze(std::string_view text);

    // True if path was closed in the most recent analysis ("" is the root)
    bool is_path_complete(const std::string &path) const;
    bool is_path_complete(const PathSegments &segments) const;

    // Copy of all complete paths
    std::set<std::string> get_complete_paths() const { return complete_paths_; }

    bool is_root_complete() const { return is_path_complete(std::string()); }

    // Span of a complete path, empty if the path is not complete
    std::optional<Span> path_span(const std::string &path) const;

    // Kind of value closed at path
    std::optional<ValueKind> path_kind(const std::string &path) const;

    // Slice of the analyzed text covered by a complete path.
    // The view is invalidated by the next analyze().
    std::optional<std::string_view> complete_text(const std::string &path) const;

    const std::map<std::string, PathRecord> &path_records() const { return records_; }

    // Spans of all complete paths
    std::map<std::string, Span> path_spans() const;

    // Text of the most recent analysis
    const std::string &source() const { return source_; }

private:

    // Open container on the scan stack
    struct Frame {
        ValueKind kind; // Object or Array
        size_t start;   // Offset of the opening bracket
        size_t count;   // Children scanned so far
    };

    std::string source_;
    std::set<std::string> complete_paths_;
    std::map<std::string, PathRecord> records_;

    // Scan state, only meaningful during analyze()
    std::vector<Frame> stack_;
    PathSegments path_;

    // Drives the whole scan; the root's own record tells whether it closed
    void scan_document();

    // Scalars: offset past the value, or empty if incomplete
    std::optional<size_t> scan_string(size_t pos);
    std::optional<size_t> scan_number(size_t start);
    std::optional<size_t> scan_literal(size_t pos);

    // Offset past the closing quote of the string starting at pos
    std::optional<size_t> skip_string(size_t pos) const;

    size_t skip_whitespace(size_t pos) const;

    void mark_complete(ValueKind kind, size_t start, size_t end);
};

} // namespace partialjson

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

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace partialjson {

// ============================================================================
// Structural paths
// ============================================================================

// One step from a container into one of its children
struct PathSegment {
    enum class Type { Key, Index };

    Type type = Type::Key;
    std::string key; // Raw key text between the quotes (escapes not decoded)
    size_t index = 0;

    static PathSegment make_key(std::string k) {
        PathSegment seg;
        seg.type = Type::Key;
        seg.key = std::move(k);
        return seg;
    }

    static PathSegment make_index(size_t i) {
        PathSegment seg;
        seg.type = Type::Index;
        seg.index = i;
        return seg;
    }

    bool is_key() const { return type == Type::Key; }
    bool is_index() const { return type == Type::Index; }

    bool operator==(const PathSegment &other) const {
        if (type != other.type)
            return false;
        return is_key() ? key == other.key : index == other.index;
    }
    bool operator!=(const PathSegment &other) const { return !(*this == other); }
};

using PathSegments = std::vector<PathSegment>;

// Append one segment to an already rendered path.
// Keys join with '.', except directly under the root; indices render as [i].
// Keys containing '.' or '[' are not escaped.
inline void append_segment(std::string &path, const PathSegment &seg) {
    if (seg.is_key()) {
        if (!path.empty())
            path += '.';
        path += seg.key;
    } else {
        path += '[';
        path += std::to_string(seg.index);
        path += ']';
    }
}

// Render a segment sequence to the flattened string form ("" is the root)
inline std::string render_path(const PathSegments &segments) {
    std::string path;
    for (const auto &seg : segments) {
        append_segment(path, seg);
    }
    return path;
}

// ============================================================================
// Spans and value kinds
// ============================================================================

// Half-open byte range [start, end) of a closed value in the analyzed text
struct Span {
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }

    bool operator==(const Span &other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const Span &other) const { return !(*this == other); }
};

// Kind of JSON value found at a path
enum class ValueKind { Object, Array, String, Number, Literal };

inline const char *value_kind_to_string(ValueKind kind) {
    switch (kind) {
    case ValueKind::Object:
        return "object";
    case ValueKind::Array:
        return "array";
    case ValueKind::String:
        return "string";
    case ValueKind::Number:
        return "number";
    case ValueKind::Literal:
        return "literal";
    default:
        return "unknown";
    }
}

// Whitespace recognised between JSON tokens
inline bool is_json_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace partialjson

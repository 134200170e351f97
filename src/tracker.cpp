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

#include "partialjson/tracker.hpp"
#include <utility>

namespace partialjson {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Characters allowed right after a number; end of input counts too
bool is_number_terminator(char c) {
    return is_json_whitespace(c) || c == ',' || c == '}' || c == ']';
}

struct Literal {
    const char *text;
    size_t length;
};

constexpr Literal LITERALS[] = {{"true", 4}, {"false", 5}, {"null", 4}};

} // namespace

void CompletenessTracker::analyze(std::string_view text) {
    source_.assign(text.data(), text.size());
    complete_paths_.clear();
    records_.clear();
    stack_.clear();
    path_.clear();

    if (skip_whitespace(0) >= source_.size())
        return;

    scan_document();

    stack_.clear();
    path_.clear();
}

bool CompletenessTracker::is_path_complete(const std::string &path) const {
    return complete_paths_.count(path) > 0;
}

bool CompletenessTracker::is_path_complete(const PathSegments &segments) const {
    return is_path_complete(render_path(segments));
}

std::optional<Span> CompletenessTracker::path_span(const std::string &path) const {
    auto it = records_.find(path);
    if (it == records_.end())
        return std::nullopt;
    return it->second.span;
}

std::optional<ValueKind> CompletenessTracker::path_kind(const std::string &path) const {
    auto it = records_.find(path);
    if (it == records_.end())
        return std::nullopt;
    return it->second.kind;
}

std::map<std::string, Span> CompletenessTracker::path_spans() const {
    std::map<std::string, Span> spans;
    for (const auto &entry : records_)
        spans.emplace_hint(spans.end(), entry.first, entry.second.span);
    return spans;
}

std::optional<std::string_view> CompletenessTracker::complete_text(const std::string &path) const {
    auto span = path_span(path);
    if (!span)
        return std::nullopt;
    return std::string_view(source_).substr(span->start, span->length());
}

// Iterative descent over the document. Containers live on stack_, the path
// of the value being scanned lives in path_. Any mismatch or end of input
// stops the scan; whatever closed before that point stays recorded.
void CompletenessTracker::scan_document() {
    const size_t n = source_.size();
    size_t pos = 0;
    bool expect_value = true;

    while (true) {
        if (expect_value) {
            pos = skip_whitespace(pos);
            if (pos >= n)
                return;

            const char c = source_[pos];
            if (c == '{' || c == '[') {
                stack_.push_back(Frame{c == '{' ? ValueKind::Object : ValueKind::Array, pos, 0});
                ++pos;
                expect_value = false;
                continue;
            }

            std::optional<size_t> end;
            if (c == '"') {
                end = scan_string(pos);
            } else if (c == '-' || is_digit(c)) {
                end = scan_number(pos);
            } else {
                end = scan_literal(pos);
            }
            if (!end)
                return;
            pos = *end;
        } else {
            Frame &frame = stack_.back();
            pos = skip_whitespace(pos);
            if (pos >= n)
                return;

            const char closer = frame.kind == ValueKind::Object ? '}' : ']';
            if (source_[pos] != closer) {
                // Every member after the first needs a separator
                if (frame.count > 0) {
                    if (source_[pos] != ',')
                        return;
                    pos = skip_whitespace(pos + 1);
                    if (pos >= n)
                        return;
                }

                if (frame.kind == ValueKind::Object) {
                    if (source_[pos] != '"')
                        return;
                    auto key_end = skip_string(pos);
                    if (!key_end)
                        return;
                    std::string key = source_.substr(pos + 1, *key_end - pos - 2);

                    pos = skip_whitespace(*key_end);
                    if (pos >= n || source_[pos] != ':')
                        return;
                    ++pos;
                    path_.push_back(PathSegment::make_key(std::move(key)));
                } else {
                    path_.push_back(PathSegment::make_index(frame.count));
                }
                expect_value = true;
                continue;
            }

            mark_complete(frame.kind, frame.start, pos + 1);
            ++pos;
            stack_.pop_back();
        }

        // A value just closed: return to the enclosing container
        if (stack_.empty())
            return;
        path_.pop_back();
        ++stack_.back().count;
        expect_value = false;
    }
}

std::optional<size_t> CompletenessTracker::scan_string(size_t pos) {
    auto end = skip_string(pos);
    if (end)
        mark_complete(ValueKind::String, pos, *end);
    return end;
}

// Boundary scan only: a backslash always swallows the next byte, escape
// legality is not checked
std::optional<size_t> CompletenessTracker::skip_string(size_t pos) const {
    const size_t n = source_.size();
    ++pos;
    while (pos < n) {
        const char c = source_[pos];
        if (c == '\\') {
            pos += 2;
        } else if (c == '"') {
            return pos + 1;
        } else {
            ++pos;
        }
    }
    return std::nullopt;
}

std::optional<size_t> CompletenessTracker::scan_number(size_t start) {
    const size_t n = source_.size();
    size_t pos = start;

    if (pos < n && source_[pos] == '-')
        ++pos;

    // Integer part: 0 or a nonzero digit run
    if (pos >= n)
        return std::nullopt;
    if (source_[pos] == '0') {
        ++pos;
    } else if (is_digit(source_[pos])) {
        while (pos < n && is_digit(source_[pos]))
            ++pos;
    } else {
        return std::nullopt;
    }

    if (pos < n && source_[pos] == '.') {
        ++pos;
        if (pos >= n || !is_digit(source_[pos]))
            return std::nullopt;
        while (pos < n && is_digit(source_[pos]))
            ++pos;
    }

    if (pos < n && (source_[pos] == 'e' || source_[pos] == 'E')) {
        ++pos;
        if (pos < n && (source_[pos] == '+' || source_[pos] == '-'))
            ++pos;
        if (pos >= n || !is_digit(source_[pos]))
            return std::nullopt;
        while (pos < n && is_digit(source_[pos]))
            ++pos;
    }

    // A number has no closing delimiter; end of the text so far counts as one
    if (pos < n && !is_number_terminator(source_[pos]))
        return std::nullopt;

    mark_complete(ValueKind::Number, start, pos);
    return pos;
}

std::optional<size_t> CompletenessTracker::scan_literal(size_t pos) {
    for (const auto &lit : LITERALS) {
        if (source_.compare(pos, lit.length, lit.text) == 0) {
            mark_complete(ValueKind::Literal, pos, pos + lit.length);
            return pos + lit.length;
        }
    }
    return std::nullopt;
}

size_t CompletenessTracker::skip_whitespace(size_t pos) const {
    while (pos < source_.size() && is_json_whitespace(source_[pos]))
        ++pos;
    return pos;
}

void CompletenessTracker::mark_complete(ValueKind kind, size_t start, size_t end) {
    std::string path = render_path(path_);
    records_[path] = PathRecord{Span{start, end}, kind};
    complete_paths_.insert(std::move(path));
}

} // namespace partialjson

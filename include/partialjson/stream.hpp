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
#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace partialjson {

enum class StreamStatus {
    Pending,  // Root not closed yet, more input may arrive
    Complete, // Root value closed
    Invalid,  // Input finished but the root never closed
    Overflow  // Buffer limit exceeded, stream stopped
};

inline const char *stream_status_to_string(StreamStatus status) {
    switch (status) {
    case StreamStatus::Pending:
        return "pending";
    case StreamStatus::Complete:
        return "complete";
    case StreamStatus::Invalid:
        return "invalid";
    case StreamStatus::Overflow:
        return "overflow";
    default:
        return "unknown";
    }
}

struct StreamUpdate {
    StreamStatus status = StreamStatus::Pending;
    std::vector<std::string> newly_complete; // Sorted
};

// Accumulates chunks of a streamed document and re-analyzes the whole
// buffer after every append.
// - append(): feed more text
// - finish(): signal no more data will arrive
// - poll(): paths that closed since the previous poll
class CompletenessStream {
public:

    explicit CompletenessStream(size_t max_buffer_bytes = 0);

    void reset();
    void append(std::string_view chunk);
    void finish();
    StreamUpdate poll();

    StreamStatus status() const;
    bool finished() const { return finished_; }

    const CompletenessTracker &tracker() const { return tracker_; }
    const std::string &buffer() const { return buf_; }

private:

    size_t max_buffer_bytes_ = 0; // 0 = unlimited
    std::string buf_;
    bool finished_ = false;
    bool overflow_ = false;
    CompletenessTracker tracker_;

    // Complete paths as of the previous poll()
    std::set<std::string> reported_;
};

} // namespace partialjson

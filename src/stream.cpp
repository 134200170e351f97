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

#include "partialjson/stream.hpp"
#include <algorithm>
#include <iterator>
#include <utility>

namespace partialjson {

CompletenessStream::CompletenessStream(size_t max_buffer_bytes)
    : max_buffer_bytes_(max_buffer_bytes) {}

void CompletenessStream::reset() {
    buf_.clear();
    finished_ = false;
    overflow_ = false;
    tracker_.analyze(buf_);
    reported_.clear();
}

void CompletenessStream::append(std::string_view chunk) {
    if (finished_ || overflow_)
        return;

    if (max_buffer_bytes_ > 0 && buf_.size() + chunk.size() > max_buffer_bytes_) {
        overflow_ = true;
        return;
    }

    buf_.append(chunk.data(), chunk.size());
    tracker_.analyze(buf_);
}

void CompletenessStream::finish() { finished_ = true; }

StreamStatus CompletenessStream::status() const {
    if (overflow_)
        return StreamStatus::Overflow;
    if (tracker_.is_root_complete())
        return StreamStatus::Complete;
    return finished_ ? StreamStatus::Invalid : StreamStatus::Pending;
}

StreamUpdate CompletenessStream::poll() {
    StreamUpdate update;
    update.status = status();
    if (update.status == StreamStatus::Overflow)
        return update;

    auto current = tracker_.get_complete_paths();
    std::set_difference(current.begin(), current.end(), reported_.begin(), reported_.end(),
                        std::back_inserter(update.newly_complete));
    reported_ = std::move(current);
    return update;
}

} // namespace partialjson

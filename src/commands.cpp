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

#include "partialjson/commands.hpp"
#include "partialjson/stream.hpp"
#include "partialjson/strict.hpp"
#include "partialjson/tracker.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace partialjson {

using json = nlohmann::json;

std::string read_input(const std::string &input) {
    if (input.empty() || input == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream file(input, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + input);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Helper function to read the document named by the config
bool load_input(const CommandConfig &config, std::string &text) {
    try {
        text = read_input(config.input);
    } catch (const std::exception &e) {
        std::cerr << "Error reading input: " << e.what() << std::endl;
        return false;
    }
    if (config.verbose) {
        std::cerr << "Read " << text.size() << " bytes from "
                  << (config.input == "-" ? "stdin" : config.input) << std::endl;
    }
    return true;
}

std::string display_path(const std::string &path) { return path.empty() ? ROOT_PATH_NAME : path; }

std::string path_from_arg(const std::string &arg) { return arg == ROOT_PATH_NAME ? "" : arg; }

static json record_to_json(const CompletenessTracker &tracker, const std::string &path) {
    json j;
    j["path"] = path;
    auto span = tracker.path_span(path);
    j["complete"] = span.has_value();
    if (span) {
        j["start"] = span->start;
        j["end"] = span->end;
        j["kind"] = value_kind_to_string(*tracker.path_kind(path));
    }
    return j;
}

int cmd_query(const CommandConfig &config, const std::vector<std::string> &paths) {
    std::string text;
    if (!load_input(config, text))
        return EXIT_ERROR;

    CompletenessTracker tracker;
    tracker.analyze(text);

    if (config.as_json) {
        json out = json::array();
        for (const auto &path : paths)
            out.push_back(record_to_json(tracker, path));
        std::cout << out.dump(2) << std::endl;
        return EXIT_OK;
    }

    for (const auto &path : paths) {
        auto span = tracker.path_span(path);
        if (span) {
            std::cout << display_path(path) << ": complete [" << span->start << ", " << span->end
                      << ")" << std::endl;
        } else {
            std::cout << display_path(path) << ": incomplete" << std::endl;
        }
    }
    return EXIT_OK;
}

int cmd_list(const CommandConfig &config) {
    std::string text;
    if (!load_input(config, text))
        return EXIT_ERROR;

    CompletenessTracker tracker;
    tracker.analyze(text);
    const auto &records = tracker.path_records();

    if (config.as_json) {
        json out = json::array();
        for (const auto &entry : records)
            out.push_back(record_to_json(tracker, entry.first));
        std::cout << out.dump(2) << std::endl;
        return EXIT_OK;
    }

    std::cout << records.size() << " complete paths" << std::endl;
    if (records.empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const auto &[path, record] : records) {
        std::cout << "  " << display_path(path) << " (" << value_kind_to_string(record.kind)
                  << ") [" << record.span.start << ", " << record.span.end << ")" << std::endl;
    }
    if (!tracker.is_root_complete()) {
        std::cout << "Root is still open." << std::endl;
    }
    return EXIT_OK;
}

int cmd_strict(const CommandConfig &config) {
    std::string text;
    if (!load_input(config, text))
        return EXIT_ERROR;

    bool complete = is_json_complete(text);
    if (config.as_json) {
        json out = {{"complete", complete}};
        std::cout << out.dump() << std::endl;
    } else {
        std::cout << (complete ? "complete" : "incomplete") << std::endl;
    }
    return complete ? EXIT_OK : EXIT_INCOMPLETE;
}

int cmd_extract(const CommandConfig &config, const std::vector<std::string> &paths) {
    std::string text;
    if (!load_input(config, text))
        return EXIT_ERROR;

    CompletenessTracker tracker;
    tracker.analyze(text);

    json out = json::object();
    for (const auto &path : paths) {
        auto value = parse_complete(tracker, path);
        if (config.as_json) {
            out[path] = value ? *value : json(nullptr);
            continue;
        }
        if (value) {
            std::cout << display_path(path) << " = " << value->dump() << std::endl;
        } else {
            std::cout << display_path(path) << ": not available" << std::endl;
        }
    }
    if (config.as_json) {
        std::cout << out.dump(2) << std::endl;
    }
    return EXIT_OK;
}

int cmd_replay(const CommandConfig &config, size_t chunk_size) {
    if (chunk_size == 0) {
        std::cerr << "Error: replay chunk size must be positive" << std::endl;
        return EXIT_ERROR;
    }

    std::string text;
    if (!load_input(config, text))
        return EXIT_ERROR;

    CompletenessStream stream;
    json steps = json::array();
    size_t step = 0;

    auto report = [&](const StreamUpdate &update) {
        if (config.as_json) {
            json entry = {{"step", step},
                          {"bytes", stream.buffer().size()},
                          {"status", stream_status_to_string(update.status)},
                          {"newly_complete", update.newly_complete}};
            steps.push_back(entry);
            return;
        }
        if (update.newly_complete.empty() && !config.verbose)
            return;
        std::cout << "step " << step << " (" << stream.buffer().size()
                  << " bytes): " << stream_status_to_string(update.status) << std::endl;
        for (const auto &path : update.newly_complete)
            std::cout << "  + " << display_path(path) << std::endl;
    };

    for (size_t offset = 0; offset < text.size(); offset += chunk_size) {
        ++step;
        stream.append(std::string_view(text).substr(offset, chunk_size));
        report(stream.poll());
    }

    stream.finish();
    StreamUpdate final_update = stream.poll();
    if (config.as_json) {
        json out = {{"steps", steps}, {"status", stream_status_to_string(final_update.status)}};
        std::cout << out.dump(2) << std::endl;
    } else {
        std::cout << "final: " << stream_status_to_string(final_update.status) << std::endl;
    }
    return final_update.status == StreamStatus::Complete ? EXIT_OK : EXIT_INCOMPLETE;
}

} // namespace partialjson

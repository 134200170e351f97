#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace partialjson {

// How the root path "" is spelled on the command line and in output
constexpr const char *ROOT_PATH_NAME = "<root>";

// Exit codes shared by all command handlers
constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_INCOMPLETE = 2;

// Options resolved from the command line
struct CommandConfig {
    std::string input = "-"; // File path, "-" reads stdin
    bool as_json = false;    // Machine-readable output
    bool verbose = false;
};

// Command handlers
int cmd_query(const CommandConfig &config, const std::vector<std::string> &paths);
int cmd_list(const CommandConfig &config);
int cmd_strict(const CommandConfig &config);
int cmd_extract(const CommandConfig &config, const std::vector<std::string> &paths);
int cmd_replay(const CommandConfig &config, size_t chunk_size);

// Helper functions
std::string read_input(const std::string &input);
bool load_input(const CommandConfig &config, std::string &text);
std::string display_path(const std::string &path);

// Inverse of display_path for paths given on the command line
std::string path_from_arg(const std::string &arg);

} // namespace partialjson

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

#include <cxxopts.hpp>
#include <iostream>

#include "partialjson/commands.hpp"
#include "partialjson/version.hpp"

using namespace partialjson;

void print_banner() {
    std::cout << "partialjson v" << VERSION_STRING
              << " - completeness of truncated JSON documents\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "partialjson", "Report which parts of a streamed or truncated JSON document are closed");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("i,input", "Input file ('-' for stdin)",
         cxxopts::value<std::string>()->default_value("-"));
    opts("p,path", "Structural paths to query (comma-separated, no spaces, <root> for the root)",
         cxxopts::value<std::vector<std::string>>());
    opts("l,list", "List all complete paths with spans");
    opts("s,strict", "Strict whole-document completeness check");
    opts("x,extract", "Print the closed value at each --path");
    opts("r,replay", "Re-feed the input N bytes at a time and report paths as they close",
         cxxopts::value<size_t>());
    opts("json", "Machine-readable JSON output");
    opts("verbose", "Print progress details to stderr");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  partialjson -i out.json --list            List closed paths"
                      << std::endl;
            std::cout << "  partialjson -i out.json -p name,items[0]  Query specific paths"
                      << std::endl;
            std::cout << "  partialjson -i out.json -x -p address     Print a closed sub-tree"
                      << std::endl;
            std::cout << "  partialjson -i out.json --strict          Whole-document verdict"
                      << std::endl;
            std::cout << "  partialjson -i out.json --replay 8        Simulate an 8-byte stream"
                      << std::endl;
            std::cout << "  cat out.json | partialjson --list --json  Read stdin, JSON output"
                      << std::endl;
            std::cout << "Path syntax: object keys joined with '.', array indices as [i], "
                         "<root> for the root."
                      << std::endl;
            std::cout << "Keys containing ',' cannot be passed to --path." << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "partialjson v" << VERSION_STRING << std::endl;
            return 0;
        }

        CommandConfig config;
        config.input = result["input"].as<std::string>();
        config.as_json = result.count("json") > 0;
        config.verbose = result.count("verbose") > 0;

        std::vector<std::string> paths;
        if (result.count("path"))
            for (const auto &arg : result["path"].as<std::vector<std::string>>())
                paths.push_back(path_from_arg(arg));

        if (result.count("strict")) {
            return cmd_strict(config);
        }

        if (result.count("replay")) {
            return cmd_replay(config, result["replay"].as<size_t>());
        }

        if (result.count("extract")) {
            if (paths.empty()) {
                std::cerr << "Error: --extract needs at least one --path" << std::endl;
                return EXIT_ERROR;
            }
            return cmd_extract(config, paths);
        }

        if (result.count("list")) {
            return cmd_list(config);
        }

        if (!paths.empty()) {
            return cmd_query(config, paths);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return EXIT_ERROR;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}

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

#include "hazgraph/commands.hpp"
#include "hazgraph/version.hpp"

using namespace hazgraph;

void print_banner() {
    std::cout << "hazgraph - Call Graph Hazard Explorer v" << VERSION_STRING << "\n" << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "hazgraph", "Call Graph Hazard Explorer - Resolve functions and find call routes");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("g,graph", "Call graph file (callgraph.txt)", cxxopts::value<std::string>());
    opts("lenient", "Skip malformed records instead of failing the load");
    opts("line-limit", "Stop reading after this many lines (0 = all)",
         cxxopts::value<size_t>()->default_value("0"));
    opts("verbose", "Print load statistics");
    opts("json", "Print results as JSON");

    opts("resolve", "Resolve a name or #id", cxxopts::value<std::string>());
    opts("callees", "List callees of a function", cxxopts::value<std::string>());
    opts("callers", "List callers of a function", cxxopts::value<std::string>());
    opts("names", "List all names of a function", cxxopts::value<std::string>());
    opts("search", "Search by stem, /regex/ or substring", cxxopts::value<std::string>());

    opts("route", "Find a call route (needs --from and --to)");
    opts("from", "Route start function", cxxopts::value<std::string>());
    opts("to", "Route targets (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("avoid", "Functions the route must not pass through (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("avoid-limits", "Do not follow edges with any of these limit bits (1 = SUPPRESS_GC)",
         cxxopts::value<EdgeLimit>()->default_value("0"));
    opts("timeout-ms", "Abandon the route search after this many milliseconds (0 = never)",
         cxxopts::value<unsigned int>()->default_value("0"));

    options.parse_positional({"graph"});
    options.positional_help("<callgraph.txt>");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  hazgraph callgraph.txt --resolve collect" << std::endl;
            std::cout << "  hazgraph callgraph.txt --resolve '#63234'" << std::endl;
            std::cout << "  hazgraph callgraph.txt --callees '#10'" << std::endl;
            std::cout << "  hazgraph callgraph.txt --search '/GCRuntime::.*collect/'" << std::endl;
            std::cout << "  hazgraph callgraph.txt --route --from RunScript --to collect" << std::endl;
            std::cout << "  hazgraph callgraph.txt --route --from '#20' --to '#10' --avoid '#15'"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "hazgraph v" << VERSION_STRING << std::endl;
            return 0;
        }

        if (!result.count("graph")) {
            std::cerr << "Error: a call graph file is required" << std::endl;
            std::cerr << options.help() << std::endl;
            return 1;
        }

        CliConfig config;
        config.graph_path = result["graph"].as<std::string>();
        config.load.policy = result.count("lenient") ? ParsePolicy::Lenient : ParsePolicy::Strict;
        config.load.line_limit = result["line-limit"].as<size_t>();
        config.load.verbose = result.count("verbose") > 0;
        config.json = result.count("json") > 0;

        QueryEngine engine;
        if (!load_engine(engine, config))
            return 1;

        if (result.count("resolve"))
            return cmd_resolve(engine, result["resolve"].as<std::string>(), config.json);

        if (result.count("callees"))
            return cmd_callees(engine, result["callees"].as<std::string>(), config.json);

        if (result.count("callers"))
            return cmd_callers(engine, result["callers"].as<std::string>(), config.json);

        if (result.count("names"))
            return cmd_names(engine, result["names"].as<std::string>(), config.json);

        if (result.count("search"))
            return cmd_search(engine, result["search"].as<std::string>(), config.json);

        if (result.count("route")) {
            if (!result.count("from") || !result.count("to")) {
                std::cerr << "Error: --route needs --from and --to" << std::endl;
                return 1;
            }
            RouteArgs args;
            args.from = result["from"].as<std::string>();
            args.to = result["to"].as<std::vector<std::string>>();
            if (result.count("avoid"))
                args.avoid = result["avoid"].as<std::vector<std::string>>();
            args.avoid_limits = result["avoid-limits"].as<EdgeLimit>();
            args.timeout_ms = result["timeout-ms"].as<unsigned int>();
            return cmd_route(engine, args, config.json);
        }

        if (!config.load.verbose) {
            print_banner();
            std::cout << options.help() << std::endl;
        }
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

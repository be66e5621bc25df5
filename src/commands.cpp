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

#include "hazgraph/commands.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hazgraph {

using json = nlohmann::json;

namespace {

// Node as JSON: id plus every known name
json node_to_json(const QueryEngine &engine, NodeId id) {
    json j;
    j["id"] = id;
    j["names"] = engine.names(id);
    return j;
}

json nodes_to_json(const QueryEngine &engine, const NodeIdList &ids) {
    json arr = json::array();
    for (NodeId id : ids) {
        arr.push_back(node_to_json(engine, id));
    }
    return arr;
}

void print_nodes(const QueryEngine &engine, const NodeIdList &ids, Brevity brevity) {
    for (NodeId id : ids) {
        std::cout << engine.describe(id, brevity) << std::endl;
    }
}

// Shared body of the callees/callers commands
int cmd_neighbors(const QueryEngine &engine, const std::string &query, bool json_out,
                  bool forward) {
    NodeId id = 0;
    if (!resolve_single(engine, query, id))
        return 1;

    NodeIdList ids = forward ? engine.callees(id) : engine.callers(id);
    if (json_out) {
        json j;
        j["node"] = node_to_json(engine, id);
        j[forward ? "callees" : "callers"] = nodes_to_json(engine, ids);
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    std::cout << ids.size() << (forward ? " callees of " : " callers of ")
              << engine.describe(id, Brevity::Normal) << std::endl;
    print_nodes(engine, ids, Brevity::Verbose);
    return 0;
}

} // namespace

bool load_engine(QueryEngine &engine, const CliConfig &config) {
    try {
        LoadResult result = engine.load_file(config.graph_path, config.load);
        if (!result.skipped.empty()) {
            std::cerr << "Warning: skipped " << result.skipped.size()
                      << " malformed records while loading " << config.graph_path << std::endl;
        }
        return true;
    } catch (const ParseError &e) {
        std::cerr << "Error loading call graph: " << e.what() << std::endl;
        std::cerr << "Use --lenient to skip malformed records." << std::endl;
        return false;
    } catch (const HazGraphError &e) {
        std::cerr << "Error loading call graph: " << e.what() << std::endl;
        return false;
    }
}

bool resolve_single(const QueryEngine &engine, const std::string &query, NodeId &out) {
    NodeIdList matches = engine.resolve(query);
    if (matches.empty()) {
        std::cerr << "Error: Unable to resolve '" << query << "'" << std::endl;
        NodeIdList similar = engine.search(query);
        if (!similar.empty()) {
            std::cerr << "Did you mean one of these?" << std::endl;
            for (size_t i = 0; i < std::min(similar.size(), size_t(5)); ++i)
                std::cerr << "  " << engine.describe(similar[i], Brevity::Normal) << std::endl;
        }
        return false;
    }
    if (matches.size() > 1) {
        std::cerr << "Error: Multiple matches for '" << query << "':" << std::endl;
        for (size_t i = 0; i < std::min(matches.size(), size_t(5)); ++i)
            std::cerr << "  " << engine.describe(matches[i], Brevity::Normal) << std::endl;
        std::cerr << "Use #<id> to pick one." << std::endl;
        return false;
    }
    out = matches.front();
    return true;
}

bool resolve_all(const QueryEngine &engine, const std::vector<std::string> &queries,
                 NodeIdList &out) {
    for (const auto &query : queries) {
        NodeIdList matches = engine.resolve(query);
        if (matches.empty()) {
            std::cerr << "Error: Unable to resolve '" << query << "'" << std::endl;
            return false;
        }
        out.insert(out.end(), matches.begin(), matches.end());
    }
    return true;
}

int cmd_resolve(const QueryEngine &engine, const std::string &query, bool json_out) {
    NodeIdList matches = engine.resolve(query);

    if (json_out) {
        json j;
        j["query"] = query;
        j["matches"] = nodes_to_json(engine, matches);
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    if (matches.empty()) {
        std::cout << "Unable to resolve '" << query << "'" << std::endl;
        return 0;
    }
    print_nodes(engine, matches, Brevity::Verbose);
    return 0;
}

int cmd_callees(const QueryEngine &engine, const std::string &query, bool json_out) {
    return cmd_neighbors(engine, query, json_out, true);
}

int cmd_callers(const QueryEngine &engine, const std::string &query, bool json_out) {
    return cmd_neighbors(engine, query, json_out, false);
}

int cmd_names(const QueryEngine &engine, const std::string &query, bool json_out) {
    NodeId id = 0;
    if (!resolve_single(engine, query, id))
        return 1;

    if (json_out) {
        std::cout << node_to_json(engine, id).dump(2) << std::endl;
        return 0;
    }
    for (const auto &name : engine.names(id)) {
        std::cout << name << std::endl;
    }
    return 0;
}

int cmd_search(const QueryEngine &engine, const std::string &pattern, bool json_out) {
    NodeIdList matches = engine.search(pattern);

    if (json_out) {
        json j;
        j["pattern"] = pattern;
        j["matches"] = nodes_to_json(engine, matches);
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    std::cout << matches.size() << " Matches found" << std::endl;
    if (matches.empty()) {
        std::cout << "  (none found)" << std::endl;
    } else {
        for (NodeId id : matches) {
            std::cout << "  " << engine.describe(id, Brevity::Normal) << std::endl;
        }
    }
    return 0;
}

int cmd_route(const QueryEngine &engine, const RouteArgs &args, bool json_out) {
    NodeId start = 0;
    if (!resolve_single(engine, args.from, start))
        return 1;

    NodeIdList targets, avoid;
    if (!resolve_all(engine, args.to, targets) || !resolve_all(engine, args.avoid, avoid))
        return 1;

    RouteOptions options;
    options.avoid_limits = args.avoid_limits;
    if (args.timeout_ms > 0) {
        options.deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(args.timeout_ms);
    }

    NodeIdList path;
    try {
        path = engine.route(start, targets, avoid, options);
    } catch (const CancelledError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (json_out) {
        json j;
        j["from"] = start;
        j["targets"] = targets;
        j["avoid"] = avoid;
        j["found"] = !path.empty();
        j["path"] = nodes_to_json(engine, path);
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    if (path.empty()) {
        std::cout << "No route found" << std::endl;
        return 0;
    }
    std::cout << "length " << path.size() << " route found:" << std::endl;
    print_nodes(engine, path, Brevity::Normal);
    return 0;
}

} // namespace hazgraph

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

#include "graph.hpp"
#include "loader.hpp"
#include "name_index.hpp"
#include "path_finder.hpp"
#include <atomic>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace hazgraph {

enum class EngineState { Uninitialized, Loading, Ready };

inline const char *engine_state_to_string(EngineState state) {
    switch (state) {
    case EngineState::Uninitialized:
        return "uninitialized";
    case EngineState::Loading:
        return "loading";
    case EngineState::Ready:
        return "ready";
    default:
        return "unknown";
    }
}

// Query engine over a loaded call graph.
//
// load() runs exactly once per engine. Until it succeeds every query throws
// NotReadyError; afterwards the graph is frozen and all const members may be
// called from any number of threads without locking.
class QueryEngine {
public:

    QueryEngine() = default;

    QueryEngine(const QueryEngine &) = delete;
    QueryEngine &operator=(const QueryEngine &) = delete;

    // Build the graph from a record stream. On any exception the engine is
    // left Uninitialized with nothing loaded. Calling load() on an engine that
    // is Loading or Ready throws std::logic_error.
    LoadResult load(std::istream &in, const LoadOptions &options = LoadOptions{});

    // Same as load(), reading from a file (IOError if it cannot be opened)
    LoadResult load_file(const std::string &filepath, const LoadOptions &options = LoadOptions{});

    EngineState state() const { return state_.load(std::memory_order_acquire); }
    bool ready() const { return state() == EngineState::Ready; }

    // "#<digits>" -> [id] if declared, [] otherwise (InvalidQueryError if the
    // digits do not parse). Anything else is an exact name lookup: every node
    // carrying the name, in first-declaration order.
    NodeIdList resolve(const std::string &query) const;

    // Direct callees / callers of a node, in declaration order
    NodeIdList callees(NodeId id) const;
    NodeIdList callers(NodeId id) const;

    // Display names of a node, in declaration order
    std::vector<std::string> names(NodeId id) const;

    // Render a node for display
    std::string describe(NodeId id, Brevity brevity = Brevity::Normal) const;

    // Loose lookup: a function stem ("collect"), a "/regex/" over all names,
    // or a substring of any name. Results in node declaration order.
    NodeIdList search(const std::string &pattern) const;

    // Shortest call path from start to any of targets avoiding avoid; empty if
    // there is none
    NodeIdList route(NodeId start, const NodeIdList &targets, const NodeIdList &avoid,
                     const RouteOptions &options = RouteOptions{}) const;

    // Direct access to the frozen structures
    const Graph &graph() const;
    const NameIndex &name_index() const;

private:

    std::atomic<EngineState> state_{EngineState::Uninitialized};
    std::unique_ptr<Graph> graph_;
    std::unique_ptr<NameIndex> names_;
    std::unique_ptr<PathFinder> finder_;

    void require_ready() const;
};

} // namespace hazgraph

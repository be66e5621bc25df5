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

#include "hazgraph/path_finder.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace hazgraph {

PathFinder::PathFinder(const Graph &graph) : graph_(graph) {}

void PathFinder::check_cancelled(const RouteOptions &options, size_t expanded) const {
    if (options.cancel && options.cancel->cancelled()) {
        throw CancelledError("route search cancelled after expanding " +
                             std::to_string(expanded) + " nodes");
    }
    if (options.deadline && std::chrono::steady_clock::now() >= *options.deadline) {
        throw CancelledError("route search deadline exceeded after expanding " +
                             std::to_string(expanded) + " nodes");
    }
}

NodeIdList PathFinder::find_route(NodeId start, const NodeIdList &targets,
                                  const NodeIdList &avoid, const RouteOptions &options) const {
    // Validate everything up front so no search work is wasted on a bad query
    NodeIndex origin = graph_.index_of(start);

    std::unordered_set<NodeIndex> goal;
    goal.reserve(targets.size());
    for (NodeId id : targets) {
        goal.insert(graph_.index_of(id));
    }

    std::unordered_set<NodeIndex> forbidden;
    forbidden.reserve(avoid.size());
    for (NodeId id : avoid) {
        forbidden.insert(graph_.index_of(id));
    }

    if (forbidden.count(origin)) {
        return {};
    }
    if (goal.count(origin)) {
        return {start};
    }
    if (goal.empty()) {
        return {};
    }

    // node -> node it was discovered from; doubles as the visited set
    std::unordered_map<NodeIndex, NodeIndex> parent;
    parent.emplace(origin, origin);

    std::vector<NodeIndex> queue;
    queue.push_back(origin);

    size_t head = 0;
    while (head < queue.size()) {
        check_cancelled(options, head);
        NodeIndex node = queue[head++];

        for (const auto &edge : graph_.out_edges(node)) {
            if (edge.limit & options.avoid_limits)
                continue;
            if (forbidden.count(edge.callee))
                continue;
            if (!parent.emplace(edge.callee, node).second)
                continue;

            if (goal.count(edge.callee)) {
                NodeIdList path;
                for (NodeIndex at = edge.callee; at != origin; at = parent[at]) {
                    path.push_back(graph_.id_at(at));
                }
                path.push_back(start);
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push_back(edge.callee);
        }
    }

    return {};
}

} // namespace hazgraph

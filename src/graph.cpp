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

#include "hazgraph/graph.hpp"
#include <algorithm>

namespace hazgraph {

// Declare a node or merge another name into it
bool Graph::declare_node(NodeId id, std::string_view name) {
    size_t slot = name_pool_.intern(name);

    auto it = index_.find(id);
    if (it == index_.end()) {
        NodeIndex index = static_cast<NodeIndex>(nodes_.size());
        nodes_.push_back(NodeRecord{id, {slot}, {}, {}});
        index_.emplace(id, index);
        return true;
    }

    auto &names = nodes_[it->second].names;
    if (std::find(names.begin(), names.end(), slot) != names.end()) {
        return false;
    }
    names.push_back(slot);
    return true;
}

// Add a call relationship
void Graph::declare_edge(NodeId caller, NodeId callee, EdgeLimit limit) {
    NodeIndex from = index_of(caller);
    NodeIndex to = index_of(callee);

    uint64_t key = edge_key(from, to);
    auto it = edge_slots_.find(key);
    if (it != edge_slots_.end()) {
        nodes_[from].callees[it->second].limit &= limit;
        return;
    }

    edge_slots_.emplace(key, nodes_[from].callees.size());
    nodes_[from].callees.push_back(CallEdge{to, limit});
    nodes_[to].callers.push_back(from);
}

NodeIndex Graph::index_of(NodeId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw UnknownNodeError(id);
    }
    return it->second;
}

// Get callees for a caller
NodeIdList Graph::callees(NodeId id) const {
    const auto &node = record(id);
    NodeIdList result;
    result.reserve(node.callees.size());
    for (const auto &edge : node.callees) {
        result.push_back(nodes_[edge.callee].id);
    }
    return result;
}

// Get callers for a callee
NodeIdList Graph::callers(NodeId id) const {
    const auto &node = record(id);
    NodeIdList result;
    result.reserve(node.callers.size());
    for (NodeIndex caller : node.callers) {
        result.push_back(nodes_[caller].id);
    }
    return result;
}

std::vector<std::string> Graph::names(NodeId id) const {
    const auto &node = record(id);
    std::vector<std::string> result;
    result.reserve(node.names.size());
    for (size_t slot : node.names) {
        result.push_back(name_pool_.get(slot));
    }
    return result;
}

std::optional<EdgeLimit> Graph::edge_limit(NodeId caller, NodeId callee) const {
    NodeIndex from = index_of(caller);
    NodeIndex to = index_of(callee);
    auto it = edge_slots_.find(edge_key(from, to));
    if (it == edge_slots_.end()) {
        return std::nullopt;
    }
    return nodes_[from].callees[it->second].limit;
}

} // namespace hazgraph

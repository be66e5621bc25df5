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

#include "errors.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hazgraph {

// Dense position of a node inside the graph, in first-declaration order
using NodeIndex = uint32_t;

// Outgoing call edge stored on the caller
struct CallEdge {
    NodeIndex callee;
    EdgeLimit limit;
};

// Call graph store. Node ids come from the record stream; internally every
// node also gets a dense NodeIndex so adjacency lists stay compact. Callee and
// caller lists keep first-insertion order, which fixes iteration order for
// every query built on top.
class Graph {
public:

    // Declare a node, or attach another name to an existing one.
    // Returns true if the name was not already attached to the node.
    bool declare_node(NodeId id, std::string_view name);

    // Add a call edge. Both ends must already be declared (UnknownNodeError).
    // A repeated caller/callee pair keeps its original position; its limit
    // becomes the intersection of both limits.
    void declare_edge(NodeId caller, NodeId callee, EdgeLimit limit = LIMIT_NONE);

    // Get callees of a node, in declaration order
    NodeIdList callees(NodeId id) const;

    // Get callers of a node, in declaration order
    NodeIdList callers(NodeId id) const;

    // Get display names of a node, in declaration order
    std::vector<std::string> names(NodeId id) const;

    // Limit of the caller -> callee edge, nullopt if there is no such edge
    std::optional<EdgeLimit> edge_limit(NodeId caller, NodeId callee) const;

    bool has_node(NodeId id) const { return index_.find(id) != index_.end(); }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edge_slots_.size(); }
    size_t distinct_names() const { return name_pool_.size(); }

    // Dense index access (used by traversals)
    NodeIndex index_of(NodeId id) const;
    NodeId id_at(NodeIndex index) const { return nodes_[index].id; }
    const std::vector<CallEdge> &out_edges(NodeIndex index) const { return nodes_[index].callees; }
    const std::vector<size_t> &name_slots(NodeIndex index) const { return nodes_[index].names; }
    const std::string &pooled_name(size_t slot) const { return name_pool_.get(slot); }

private:

    struct NodeRecord {
        NodeId id;
        std::vector<size_t> names;    // indices into name_pool_
        std::vector<CallEdge> callees;
        std::vector<NodeIndex> callers;
    };

    static uint64_t edge_key(NodeIndex caller, NodeIndex callee) {
        return (static_cast<uint64_t>(caller) << 32) | callee;
    }

    const NodeRecord &record(NodeId id) const { return nodes_[index_of(id)]; }

    std::vector<NodeRecord> nodes_;
    std::unordered_map<NodeId, NodeIndex> index_;
    StringPool name_pool_;

    // caller/callee pair -> position in the caller's callee list
    std::unordered_map<uint64_t, size_t> edge_slots_;
};

} // namespace hazgraph

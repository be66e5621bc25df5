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
#include <atomic>
#include <chrono>
#include <optional>

namespace hazgraph {

// Cancellation flag shared between a searching thread and its controller
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

// Route search configuration
struct RouteOptions {
    // Edges whose limit shares a bit with this mask are not followed
    EdgeLimit avoid_limits = LIMIT_NONE;

    // Checked once per expanded node; either one firing throws CancelledError
    const CancelToken *cancel = nullptr;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

// Shortest call path search with avoid constraints.
// The finder holds no per-search state, so one instance may serve many
// threads at once as long as the graph is not modified.
class PathFinder {
public:

    explicit PathFinder(const Graph &graph);

    // Breadth-first search from start to the nearest member of targets that
    // never touches a node in avoid. Returns the path (start first) or an
    // empty list when no target is reachable. Every id is validated before the
    // search starts (UnknownNodeError).
    NodeIdList find_route(NodeId start, const NodeIdList &targets, const NodeIdList &avoid,
                          const RouteOptions &options = RouteOptions{}) const;

private:

    const Graph &graph_;

    void check_cancelled(const RouteOptions &options, size_t expanded) const;
};

} // namespace hazgraph

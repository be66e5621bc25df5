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

#include "hazgraph/query.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <unordered_set>

namespace hazgraph {

LoadResult QueryEngine::load(std::istream &in, const LoadOptions &options) {
    EngineState expected = EngineState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, EngineState::Loading,
                                        std::memory_order_acq_rel)) {
        throw std::logic_error(std::string("load() called on an engine that is ") +
                               engine_state_to_string(expected));
    }

    try {
        auto graph = std::make_unique<Graph>();
        auto names = std::make_unique<NameIndex>();
        LoadResult result = ingest(in, options, *graph, *names);

        graph_ = std::move(graph);
        names_ = std::move(names);
        finder_ = std::make_unique<PathFinder>(*graph_);
        state_.store(EngineState::Ready, std::memory_order_release);
        return result;
    } catch (...) {
        // No partially loaded graph survives a failed load
        finder_.reset();
        names_.reset();
        graph_.reset();
        state_.store(EngineState::Uninitialized, std::memory_order_release);
        throw;
    }
}

LoadResult QueryEngine::load_file(const std::string &filepath, const LoadOptions &options) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open call graph for reading: " + filepath);
    }
    return load(file, options);
}

void QueryEngine::require_ready() const {
    if (state() != EngineState::Ready) {
        throw NotReadyError();
    }
}

const Graph &QueryEngine::graph() const {
    require_ready();
    return *graph_;
}

const NameIndex &QueryEngine::name_index() const {
    require_ready();
    return *names_;
}

NodeIdList QueryEngine::resolve(const std::string &query) const {
    require_ready();

    if (!query.empty() && query.front() == ID_MARKER) {
        const char *first = query.data() + 1;
        const char *last = query.data() + query.size();
        if (first == last || !std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; })) {
            throw InvalidQueryError(query, "expected digits after '#'");
        }

        NodeId id = 0;
        auto [ptr, ec] = std::from_chars(first, last, id);
        if (ec != std::errc() || ptr != last) {
            throw InvalidQueryError(query, "node id out of range");
        }

        if (!graph_->has_node(id)) {
            return {};
        }
        return {id};
    }

    return names_->lookup(query);
}

NodeIdList QueryEngine::callees(NodeId id) const {
    require_ready();
    return graph_->callees(id);
}

NodeIdList QueryEngine::callers(NodeId id) const {
    require_ready();
    return graph_->callers(id);
}

std::vector<std::string> QueryEngine::names(NodeId id) const {
    require_ready();
    return graph_->names(id);
}

std::string QueryEngine::describe(NodeId id, Brevity brevity) const {
    require_ready();
    auto all = graph_->names(id);

    switch (brevity) {
    case Brevity::Brief:
        return all.front();
    case Brevity::Verbose: {
        std::string s = "#" + std::to_string(id) + " = " + all.front();
        for (size_t i = 1; i < all.size(); ++i) {
            s += "\n  " + all[i];
        }
        return s;
    }
    case Brevity::Normal:
    default:
        // Prefer the first alternate (unmangled) name when there is one
        return "#" + std::to_string(id) + " = " + (all.size() > 1 ? all[1] : all.front());
    }
}

NodeIdList QueryEngine::search(const std::string &pattern) const {
    require_ready();
    if (pattern.empty()) {
        throw InvalidQueryError(pattern, "empty search pattern");
    }

    const Graph &g = *graph_;
    NodeIdList matches;

    // Exact stem match
    const auto &stem_ids = names_->lookup_stem(pattern);
    if (!stem_ids.empty()) {
        std::unordered_set<NodeId> seen;
        for (NodeId id : stem_ids) {
            if (seen.insert(id).second) {
                matches.push_back(id);
            }
        }
        std::sort(matches.begin(), matches.end(), [&g](NodeId a, NodeId b) {
            return g.index_of(a) < g.index_of(b);
        });
        return matches;
    }

    auto scan = [&g, &matches](const auto &predicate) {
        for (NodeIndex i = 0; i < g.node_count(); ++i) {
            for (size_t slot : g.name_slots(i)) {
                if (predicate(g.pooled_name(slot))) {
                    matches.push_back(g.id_at(i));
                    break;
                }
            }
        }
    };

    // Regex match if pattern is /.../
    if (pattern.size() >= 2 && pattern.front() == '/' && pattern.back() == '/') {
        std::regex matcher;
        try {
            matcher = std::regex(pattern.substr(1, pattern.size() - 2), std::regex::ECMAScript);
        } catch (const std::regex_error &e) {
            throw InvalidQueryError(pattern, e.what());
        }
        scan([&matcher](const std::string &name) { return std::regex_search(name, matcher); });
        return matches;
    }

    // Substring match against all names
    scan([&pattern](const std::string &name) { return name.find(pattern) != std::string::npos; });
    return matches;
}

NodeIdList QueryEngine::route(NodeId start, const NodeIdList &targets, const NodeIdList &avoid,
                              const RouteOptions &options) const {
    require_ready();
    return finder_->find_route(start, targets, avoid, options);
}

} // namespace hazgraph

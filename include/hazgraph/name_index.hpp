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

#include "types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>

namespace hazgraph {

// Display name -> node ids carrying that name, in first-seen order.
// Names are not unique (overloads, instantiations, merged duplicates), so
// every lookup returns the full candidate list.
class NameIndex {
public:

    // Index id under name (and under the name's stem)
    void record(std::string_view name, NodeId id);

    // Ids carrying exactly this name; empty if the name is unknown
    const NodeIdList &lookup(std::string_view name) const;

    // Ids with a name whose stem is this, e.g. "collect" for
    // "js::gc::GCRuntime::collect(bool)". May repeat an id.
    const NodeIdList &lookup_stem(std::string_view stem) const;

    // Number of distinct names
    size_t size() const { return by_name_.size(); }

private:

    static void append(NodeIdList &ids, NodeId id);

    std::unordered_map<std::string, NodeIdList> by_name_;
    std::unordered_map<std::string, NodeIdList> by_stem_;
};

} // namespace hazgraph

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

#include "hazgraph/name_index.hpp"

namespace hazgraph {

void NameIndex::append(NodeIdList &ids, NodeId id) {
    // Repeated identical declarations arrive back to back
    if (ids.empty() || ids.back() != id) {
        ids.push_back(id);
    }
}

void NameIndex::record(std::string_view name, NodeId id) {
    append(by_name_[std::string(name)], id);

    append(by_stem_[std::string(name_stem(name))], id);
}

const NodeIdList &NameIndex::lookup(std::string_view name) const {
    static const NodeIdList empty;
    auto it = by_name_.find(std::string(name));
    return (it != by_name_.end()) ? it->second : empty;
}

const NodeIdList &NameIndex::lookup_stem(std::string_view stem) const {
    static const NodeIdList empty;
    auto it = by_stem_.find(std::string(stem));
    return (it != by_stem_.end()) ? it->second : empty;
}

} // namespace hazgraph

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

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hazgraph {

// ============================================================================
// String Pool - Intern strings to avoid duplication
// ============================================================================
// Overloaded functions and template instantiations share display names, so
// every name is stored once and nodes refer to it by index. Storage is a deque
// so the string_view keys of the index never dangle when the pool grows.
class StringPool {
public:
    // Intern a string and return its index
    size_t intern(std::string_view str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        size_t idx = strings_.size();
        strings_.emplace_back(str);
        index_.emplace(std::string_view(strings_.back()), idx);
        return idx;
    }

    // Get string by index
    const std::string &get(size_t idx) const {
        static const std::string empty;
        return (idx < strings_.size()) ? strings_[idx] : empty;
    }

    // Get index for string (returns SIZE_MAX if not found)
    size_t find(std::string_view str) const {
        auto it = index_.find(str);
        return (it != index_.end()) ? it->second : SIZE_MAX;
    }

    size_t size() const { return strings_.size(); }

    void clear() {
        strings_.clear();
        index_.clear();
    }

    auto begin() const { return strings_.begin(); }
    auto end() const { return strings_.end(); }

private:
    std::deque<std::string> strings_;
    std::unordered_map<std::string_view, size_t> index_;
};

// Node identifier, taken verbatim from the record stream
using NodeId = uint64_t;

// Ordered sequence of node ids (resolve results, adjacency, routes)
using NodeIdList = std::vector<NodeId>;

// Bit set attached to an edge describing the context the call is made in
using EdgeLimit = uint32_t;

constexpr EdgeLimit LIMIT_NONE = 0;
constexpr EdgeLimit LIMIT_SUPPRESS_GC = 1;

// Prefix marking a resolve query as a literal node id ("#1234")
constexpr char ID_MARKER = '#';

// How much detail describe() renders for a node
enum class Brevity { Brief, Normal, Verbose };

// What load() does with a malformed record
enum class ParsePolicy {
    Strict,  // abort the load on the first malformed record
    Lenient  // skip the record and report it in LoadResult::skipped
};

inline const char *parse_policy_to_string(ParsePolicy policy) {
    switch (policy) {
    case ParsePolicy::Strict:
        return "strict";
    case ParsePolicy::Lenient:
        return "lenient";
    default:
        return "unknown";
    }
}

// Simple function name of a display name: the identifier right before the
// first parameter list, e.g. "js::gc::GCRuntime::collect(bool)" -> "collect".
// Names without a parameter list are their own stem.
inline std::string_view name_stem(std::string_view name) {
    auto is_word = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_';
    };

    for (size_t paren = name.find('('); paren != std::string_view::npos;
         paren = name.find('(', paren + 1)) {
        if (paren == 0 || !is_word(name[paren - 1]))
            continue;
        size_t begin = paren - 1;
        while (begin > 0 && is_word(name[begin - 1]))
            --begin;
        return name.substr(begin, paren - begin);
    }
    return name;
}

} // namespace hazgraph

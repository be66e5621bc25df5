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
#include "graph.hpp"
#include "name_index.hpp"
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace hazgraph {

// Callback for progress reporting
using LoadProgressCallback =
    std::function<void(size_t lines, size_t nodes, size_t edges)>;

// Loader configuration
struct LoadOptions {
    ParsePolicy policy = ParsePolicy::Strict;

    // Stop after this many lines (0 = read everything)
    size_t line_limit = 0;

    // Print a summary to stdout and skipped records to stderr
    bool verbose = false;

    LoadProgressCallback progress_callback = nullptr;
    size_t progress_interval = 100000; // lines between progress callbacks
};

// A record skipped under ParsePolicy::Lenient
struct LoadDiagnostic {
    size_t line = 0;
    std::string text;
    ErrorCode code = ErrorCode::Parse;
    std::string message;
};

struct LoadStats {
    size_t lines = 0;
    size_t node_records = 0;
    size_t edge_records = 0;
    size_t ignored_records = 0;
    size_t nodes = 0;
    size_t edges = 0;
    size_t names = 0;
};

struct LoadResult {
    LoadStats stats;
    std::vector<LoadDiagnostic> skipped;
};

// Single ingestion pass: feed every record of in to graph and index.
// Under ParsePolicy::Strict the first malformed record (ParseError) or edge to
// an undeclared node (UnknownNodeError) is rethrown and the caller must
// discard graph and index. Read failures throw IOError under either policy.
LoadResult ingest(std::istream &in, const LoadOptions &options, Graph &graph, NameIndex &index);

} // namespace hazgraph

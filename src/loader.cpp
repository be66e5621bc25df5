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

#include "hazgraph/loader.hpp"
#include "hazgraph/parser.hpp"
#include <iostream>
#include <utility>

namespace hazgraph {

namespace {

void skip_record(LoadResult &result, const LoadOptions &options, LoadDiagnostic diag) {
    if (options.verbose) {
        std::cerr << "Skipping line " << diag.line << ": " << diag.message << std::endl;
    }
    result.skipped.push_back(std::move(diag));
}

} // namespace

LoadResult ingest(std::istream &in, const LoadOptions &options, Graph &graph, NameIndex &index) {
    LoadResult result;
    RecordParser parser(in, options.line_limit);
    const bool strict = options.policy == ParsePolicy::Strict;
    size_t next_progress = options.progress_interval;

    auto report_progress = [&]() {
        if (options.progress_callback) {
            options.progress_callback(parser.line(), graph.node_count(), graph.edge_count());
        }
    };

    Record rec;
    while (true) {
        try {
            if (!parser.next(rec))
                break;
        } catch (const ParseError &e) {
            if (strict)
                throw;
            skip_record(result, options, {e.line(), e.text(), ErrorCode::Parse, e.reason()});
            continue;
        }

        if (rec.kind == RecordKind::Node) {
            result.stats.node_records++;
            // Only newly attached names go to the index, keeping both in sync
            if (graph.declare_node(rec.id, rec.name)) {
                index.record(rec.name, rec.id);
            }
        } else {
            result.stats.edge_records++;
            try {
                graph.declare_edge(rec.caller, rec.callee, rec.limit);
            } catch (const UnknownNodeError &e) {
                if (strict)
                    throw;
                skip_record(result, options,
                            {rec.line, parser.text(), ErrorCode::UnknownNode, e.what()});
            }
        }

        if (options.progress_interval > 0 && parser.line() >= next_progress) {
            report_progress();
            next_progress = parser.line() + options.progress_interval;
        }
    }

    result.stats.lines = parser.line();
    result.stats.ignored_records = parser.ignored_records();
    result.stats.nodes = graph.node_count();
    result.stats.edges = graph.edge_count();
    result.stats.names = index.size();
    report_progress();

    if (options.verbose) {
        std::cout << "Loaded call graph (" << parse_policy_to_string(options.policy) << ")."
                  << std::endl;
        std::cout << "  Lines read: " << result.stats.lines << std::endl;
        std::cout << "  Nodes: " << result.stats.nodes << std::endl;
        std::cout << "  Edges: " << result.stats.edges << std::endl;
        std::cout << "  Distinct names: " << result.stats.names << std::endl;
        std::cout << "  Ignored records: " << result.stats.ignored_records << std::endl;
        std::cout << "  Skipped records: " << result.skipped.size() << std::endl;
    }

    return result;
}

} // namespace hazgraph

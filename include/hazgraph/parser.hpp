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
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace hazgraph {

// Declaration kinds produced by the parser
enum class RecordKind { Node, Edge };

// One declaration from the call graph stream.
//
//   #<id> <name>              node declaration (mangled name)
//   = <id> <name>             additional (unmangled) name for a node
//   D|R [qualifiers] <a> <b>  call edge a -> b; qualifiers are "/<bits>" or
//                             "SUPPRESS_GC" and set EdgeLimit bits
//   F|I|T|V ...               field, indirect, tag and virtual records (ignored)
struct Record {
    RecordKind kind = RecordKind::Node;
    size_t line = 0; // 1-based line number in the stream

    // RecordKind::Node
    NodeId id = 0;
    std::string name;

    // RecordKind::Edge
    NodeId caller = 0;
    NodeId callee = 0;
    EdgeLimit limit = LIMIT_NONE;
};

// Streaming parser for the call graph record format. Reads one line at a
// time and never looks further ahead than the record it returns.
class RecordParser {
public:

    // line_limit > 0 stops the parser after that many lines
    explicit RecordParser(std::istream &in, size_t line_limit = 0);

    // Advance to the next node or edge declaration. Returns false at the end
    // of the stream (or the line limit). A malformed record throws ParseError;
    // the parser has already moved past it, so calling next() again resumes
    // with the following line. A failing stream throws IOError.
    bool next(Record &out);

    // Number of lines consumed so far
    size_t line() const { return line_; }

    // Raw text of the line most recently read
    const std::string &text() const { return buffer_; }

    // Records of a known but unused kind (F, I, T, V) skipped so far
    size_t ignored_records() const { return ignored_; }

    // Parse a single line. Returns nullopt for blank lines and ignored record
    // kinds; throws ParseError if the line is malformed.
    static std::optional<Record> parse_line(std::string_view text, size_t line);

private:

    std::istream &in_;
    size_t line_limit_;
    size_t line_ = 0;
    size_t ignored_ = 0;
    std::string buffer_;
};

} // namespace hazgraph

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

#include "hazgraph/parser.hpp"
#include <charconv>
#include <utility>
#include <vector>

namespace hazgraph {

namespace {

constexpr std::string_view SUPPRESS_GC_MARKER = "SUPPRESS_GC";

// Parse an unsigned decimal token; the whole token must be digits
template <typename T>
bool parse_number(std::string_view token, T &out) {
    if (token.empty())
        return false;
    const char *first = token.data();
    const char *last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

// Split on runs of spaces/tabs
std::vector<std::string_view> split_fields(std::string_view text) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos)
            break;
        size_t end = text.find_first_of(" \t", start);
        if (end == std::string_view::npos)
            end = text.size();
        fields.push_back(text.substr(start, end - start));
        pos = end;
    }
    return fields;
}

[[noreturn]] void fail(std::string_view text, size_t line, const std::string &reason) {
    throw ParseError(line, std::string(text), reason);
}

// "#<id> <name>"
Record parse_node(std::string_view text, size_t line) {
    size_t space = text.find(' ');
    if (space == std::string_view::npos)
        fail(text, line, "node declaration without a name");

    Record rec;
    rec.kind = RecordKind::Node;
    rec.line = line;
    if (!parse_number(text.substr(1, space - 1), rec.id))
        fail(text, line, "invalid node id");

    std::string_view name = text.substr(space + 1);
    if (name.empty())
        fail(text, line, "node declaration without a name");
    rec.name = std::string(name);
    return rec;
}

// "= <id> <name>"
Record parse_alias(std::string_view text, size_t line) {
    if (text.size() < 2 || text[1] != ' ')
        fail(text, line, "malformed name record");

    std::string_view rest = text.substr(2);
    size_t space = rest.find(' ');
    if (space == std::string_view::npos)
        fail(text, line, "name record without a name");

    Record rec;
    rec.kind = RecordKind::Node;
    rec.line = line;
    if (!parse_number(rest.substr(0, space), rec.id))
        fail(text, line, "invalid node id");

    std::string_view name = rest.substr(space + 1);
    if (name.empty())
        fail(text, line, "name record without a name");
    rec.name = std::string(name);
    return rec;
}

// "D [/<bits>] [SUPPRESS_GC] <caller> <callee>" (or 'R')
Record parse_edge(std::string_view text, size_t line) {
    if (text.size() < 2 || text[1] != ' ')
        fail(text, line, "malformed edge record");

    auto fields = split_fields(text.substr(2));

    Record rec;
    rec.kind = RecordKind::Edge;
    rec.line = line;

    size_t i = 0;
    for (; i < fields.size(); ++i) {
        std::string_view field = fields[i];
        if (field == SUPPRESS_GC_MARKER) {
            rec.limit |= LIMIT_SUPPRESS_GC;
        } else if (field.front() == '/') {
            EdgeLimit bits = LIMIT_NONE;
            if (!parse_number(field.substr(1), bits))
                fail(text, line, "malformed limit");
            rec.limit |= bits;
        } else {
            break;
        }
    }

    if (fields.size() - i < 2)
        fail(text, line, "edge record needs a caller and a callee");
    if (fields.size() - i > 2)
        fail(text, line, "unexpected fields after callee");
    if (!parse_number(fields[i], rec.caller))
        fail(text, line, "invalid caller id");
    if (!parse_number(fields[i + 1], rec.callee))
        fail(text, line, "invalid callee id");
    return rec;
}

} // namespace

RecordParser::RecordParser(std::istream &in, size_t line_limit)
    : in_(in), line_limit_(line_limit) {
    buffer_.reserve(4096);
}

bool RecordParser::next(Record &out) {
    while (line_limit_ == 0 || line_ < line_limit_) {
        if (!std::getline(in_, buffer_)) {
            if (in_.bad()) {
                throw IOError("failed to read call graph after line " + std::to_string(line_));
            }
            return false;
        }
        ++line_;

        auto rec = parse_line(buffer_, line_);
        if (rec) {
            out = std::move(*rec);
            return true;
        }
        if (buffer_.find_first_not_of("\r\n") != std::string::npos)
            ++ignored_;
    }
    return false;
}

std::optional<Record> RecordParser::parse_line(std::string_view text, size_t line) {
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n'))
        text.remove_suffix(1);

    if (text.empty())
        return std::nullopt;

    switch (text.front()) {
    case '#':
        return parse_node(text, line);
    case '=':
        return parse_alias(text, line);
    case 'D':
    case 'R':
        return parse_edge(text, line);
    case 'F': // field call
    case 'I': // indirect call
    case 'T': // tag
    case 'V': // virtual method
        return std::nullopt;
    default:
        fail(text, line, "unrecognized record type");
    }
}

} // namespace hazgraph

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
#include <stdexcept>
#include <string>
#include <utility>

namespace hazgraph {

// Error categories reported by the engine
enum class ErrorCode { Io, Parse, UnknownNode, InvalidQuery, NotReady, Cancelled };

inline const char *error_code_to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::Io:
        return "io";
    case ErrorCode::Parse:
        return "parse";
    case ErrorCode::UnknownNode:
        return "unknown-node";
    case ErrorCode::InvalidQuery:
        return "invalid-query";
    case ErrorCode::NotReady:
        return "not-ready";
    case ErrorCode::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

// Base class of every exception thrown by hazgraph. Load-time errors (Io,
// Parse) leave no usable graph; query-time errors are local to the call.
class HazGraphError : public std::runtime_error {
public:
    HazGraphError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// The input could not be opened or read
class IOError : public HazGraphError {
public:
    explicit IOError(const std::string &message) : HazGraphError(ErrorCode::Io, message) {}
};

// A record could not be parsed. line() is 1-based; text() is the raw record.
class ParseError : public HazGraphError {
public:
    ParseError(size_t line, std::string text, const std::string &reason)
        : HazGraphError(ErrorCode::Parse,
                        "line " + std::to_string(line) + ": " + reason + ": '" + text + "'"),
          line_(line), text_(std::move(text)), reason_(reason) {}

    size_t line() const noexcept { return line_; }
    const std::string &text() const noexcept { return text_; }
    const std::string &reason() const noexcept { return reason_; }

private:
    size_t line_;
    std::string text_;
    std::string reason_;
};

// An operation referenced an id that was never declared
class UnknownNodeError : public HazGraphError {
public:
    explicit UnknownNodeError(NodeId id)
        : HazGraphError(ErrorCode::UnknownNode, "unknown node #" + std::to_string(id)), id_(id) {}

    NodeId id() const noexcept { return id_; }

private:
    NodeId id_;
};

// A query string that cannot be interpreted ("#12x", a bad /regex/)
class InvalidQueryError : public HazGraphError {
public:
    InvalidQueryError(std::string query, const std::string &reason)
        : HazGraphError(ErrorCode::InvalidQuery, "invalid query '" + query + "': " + reason),
          query_(std::move(query)) {}

    const std::string &query() const noexcept { return query_; }

private:
    std::string query_;
};

// A query was issued before load() completed successfully
class NotReadyError : public HazGraphError {
public:
    NotReadyError() : HazGraphError(ErrorCode::NotReady, "call graph is not loaded") {}
};

// A route search was stopped by its cancel token or deadline
class CancelledError : public HazGraphError {
public:
    explicit CancelledError(const std::string &message)
        : HazGraphError(ErrorCode::Cancelled, message) {}
};

} // namespace hazgraph

#pragma once

#include "query.hpp"
#include <string>
#include <vector>

namespace hazgraph {

// Settings shared by every command
struct CliConfig {
    std::string graph_path;
    LoadOptions load;
    bool json = false;
};

// Route command arguments (node queries, resolved before searching)
struct RouteArgs {
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> avoid;
    EdgeLimit avoid_limits = LIMIT_NONE;
    unsigned int timeout_ms = 0; // 0 = no deadline
};

// Command handlers
int cmd_resolve(const QueryEngine &engine, const std::string &query, bool json);
int cmd_callees(const QueryEngine &engine, const std::string &query, bool json);
int cmd_callers(const QueryEngine &engine, const std::string &query, bool json);
int cmd_names(const QueryEngine &engine, const std::string &query, bool json);
int cmd_search(const QueryEngine &engine, const std::string &pattern, bool json);
int cmd_route(const QueryEngine &engine, const RouteArgs &args, bool json);

// Helper functions
bool load_engine(QueryEngine &engine, const CliConfig &config);
bool resolve_single(const QueryEngine &engine, const std::string &query, NodeId &out);
bool resolve_all(const QueryEngine &engine, const std::vector<std::string> &queries,
                 NodeIdList &out);

} // namespace hazgraph

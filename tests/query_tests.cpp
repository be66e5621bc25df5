/**
 * @file query_tests.cpp
 * @brief Unit tests for QueryEngine (lifecycle, resolve, describe, search, route)
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>
#include "hazgraph/query.hpp"

using namespace hazgraph;

namespace
{

// Shape of a real hazard analysis graph: a GC entry point reachable from the
// script runner through one intermediate frame.
const char *kHazardGraph = "#10 _ZN2js2gc9GCRuntime7collectEb\n"
                           "= 10 collect\n"
                           "= 10 js::gc::GCRuntime::collect(bool)\n"
                           "#20 RunScript\n"
                           "#15 _ZN2js8Interpret\n"
                           "= 15 js::Interpret(JSContext*)\n"
                           "#30 init\n"
                           "#31 init\n"
                           "#40 js::Nursery::collect(JS::GCReason)\n"
                           "D 20 15\n"
                           "D 15 10\n"
                           "D SUPPRESS_GC 20 40\n"
                           "D 30 20\n";

void load_string(QueryEngine &engine, const std::string &text, LoadOptions options = LoadOptions{})
{
    std::istringstream in(text);
    engine.load(in, options);
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

TEST(QueryEngineTests, QueriesBeforeLoadThrowNotReady)
{
    QueryEngine engine;
    EXPECT_EQ(engine.state(), EngineState::Uninitialized);
    EXPECT_FALSE(engine.ready());

    EXPECT_THROW(engine.resolve("collect"), NotReadyError);
    EXPECT_THROW(engine.callees(10), NotReadyError);
    EXPECT_THROW(engine.callers(10), NotReadyError);
    EXPECT_THROW(engine.names(10), NotReadyError);
    EXPECT_THROW(engine.describe(10), NotReadyError);
    EXPECT_THROW(engine.search("collect"), NotReadyError);
    EXPECT_THROW(engine.route(20, {10}, {}), NotReadyError);
    EXPECT_THROW(engine.graph(), NotReadyError);
}

TEST(QueryEngineTests, SuccessfulLoadMakesEngineReady)
{
    QueryEngine engine;
    std::istringstream in(kHazardGraph);
    LoadResult result = engine.load(in);

    EXPECT_EQ(engine.state(), EngineState::Ready);
    EXPECT_EQ(result.stats.nodes, 6u);
    EXPECT_EQ(result.stats.edges, 4u);
    EXPECT_TRUE(result.skipped.empty());
}

TEST(QueryEngineTests, SecondLoadIsRejected)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);
    EXPECT_THROW(load_string(engine, "#1 other\n"), std::logic_error);

    // The loaded graph is untouched
    EXPECT_EQ(engine.state(), EngineState::Ready);
    EXPECT_EQ(engine.resolve("RunScript"), (NodeIdList{20}));
}

TEST(QueryEngineTests, FailedLoadLeavesEngineEmptyAndReloadable)
{
    QueryEngine engine;
    EXPECT_THROW(load_string(engine, "#1 a\nD 1 2\n"), UnknownNodeError);
    EXPECT_EQ(engine.state(), EngineState::Uninitialized);
    EXPECT_THROW(engine.resolve("a"), NotReadyError);

    load_string(engine, "#1 a\n#2 b\nD 1 2\n");
    EXPECT_TRUE(engine.ready());
    EXPECT_EQ(engine.callees(1), (NodeIdList{2}));
}

TEST(QueryEngineTests, LenientLoadSucceedsWithDiagnostics)
{
    QueryEngine engine;
    std::istringstream in("#1 a\nnonsense\n#2 b\nD 1 2\n");
    LoadOptions options;
    options.policy = ParsePolicy::Lenient;
    LoadResult result = engine.load(in, options);

    EXPECT_TRUE(engine.ready());
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].line, 2u);
    EXPECT_EQ(engine.callees(1), (NodeIdList{2}));
}

TEST(QueryEngineTests, MissingFileThrowsIOError)
{
    QueryEngine engine;
    EXPECT_THROW(engine.load_file("/nonexistent/hazgraph/callgraph.txt"), IOError);
    EXPECT_EQ(engine.state(), EngineState::Uninitialized);
}

// ============================================================================
// Resolve
// ============================================================================

TEST(QueryEngineTests, HazardScenario)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.resolve("collect"), (NodeIdList{10}));
    EXPECT_EQ(engine.resolve("RunScript"), (NodeIdList{20}));
    EXPECT_EQ(engine.route(20, {10}, {}), (NodeIdList{20, 15, 10}));
    EXPECT_TRUE(engine.resolve("#63234").empty());
}

TEST(QueryEngineTests, ResolveById)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.resolve("#15"), (NodeIdList{15}));
    EXPECT_EQ(engine.resolve("#015"), (NodeIdList{15}));
    EXPECT_TRUE(engine.resolve("#16").empty());
}

TEST(QueryEngineTests, ResolveRejectsMalformedIds)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_THROW(engine.resolve("#"), InvalidQueryError);
    EXPECT_THROW(engine.resolve("#abc"), InvalidQueryError);
    EXPECT_THROW(engine.resolve("#12x"), InvalidQueryError);
    EXPECT_THROW(engine.resolve("#-1"), InvalidQueryError);
    EXPECT_THROW(engine.resolve("#99999999999999999999999"), InvalidQueryError);

    try {
        engine.resolve("#abc");
        FAIL() << "expected InvalidQueryError";
    } catch (const InvalidQueryError &e) {
        EXPECT_EQ(e.query(), "#abc");
        EXPECT_EQ(e.code(), ErrorCode::InvalidQuery);
    }
}

TEST(QueryEngineTests, ResolveByNameIsExact)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.resolve("init"), (NodeIdList{30, 31}));
    EXPECT_EQ(engine.resolve("js::gc::GCRuntime::collect(bool)"), (NodeIdList{10}));
    EXPECT_EQ(engine.resolve("_ZN2js2gc9GCRuntime7collectEb"), (NodeIdList{10}));
    EXPECT_TRUE(engine.resolve("Collect").empty());
    EXPECT_TRUE(engine.resolve("").empty());
    EXPECT_TRUE(engine.resolve("js::Interpret").empty());
}

TEST(QueryEngineTests, EveryIdHasItsNames)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    for (const auto &name : engine.names(10)) {
        auto ids = engine.resolve(name);
        EXPECT_NE(std::find(ids.begin(), ids.end(), NodeId(10)), ids.end()) << name;
    }
    EXPECT_EQ(engine.resolve("#10"), (NodeIdList{10}));
}

// ============================================================================
// Adjacency and Names
// ============================================================================

TEST(QueryEngineTests, CalleesAndCallers)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.callees(20), (NodeIdList{15, 40}));
    EXPECT_EQ(engine.callers(20), (NodeIdList{30}));
    EXPECT_TRUE(engine.callees(10).empty());
    EXPECT_THROW(engine.callees(63234), UnknownNodeError);
}

TEST(QueryEngineTests, NamesKeepDeclarationOrder)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.names(10), (std::vector<std::string>{"_ZN2js2gc9GCRuntime7collectEb",
                                                         "collect",
                                                         "js::gc::GCRuntime::collect(bool)"}));
    EXPECT_THROW(engine.names(63234), UnknownNodeError);
}

TEST(QueryEngineTests, DescribeFormats)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.describe(15, Brevity::Brief), "_ZN2js8Interpret");
    EXPECT_EQ(engine.describe(15, Brevity::Normal), "#15 = js::Interpret(JSContext*)");
    EXPECT_EQ(engine.describe(20, Brevity::Normal), "#20 = RunScript");
    EXPECT_EQ(engine.describe(10, Brevity::Verbose),
              "#10 = _ZN2js2gc9GCRuntime7collectEb\n"
              "  collect\n"
              "  js::gc::GCRuntime::collect(bool)");
    EXPECT_THROW(engine.describe(63234), UnknownNodeError);
}

// ============================================================================
// Search
// ============================================================================

TEST(QueryEngineTests, SearchByStem)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    // "collect" is both a plain name of #10 and the stem of two signatures
    EXPECT_EQ(engine.search("collect"), (NodeIdList{10, 40}));
    EXPECT_EQ(engine.search("Interpret"), (NodeIdList{15}));
}

TEST(QueryEngineTests, SearchByRegex)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.search("/^js::.*collect/"), (NodeIdList{10, 40}));
    EXPECT_EQ(engine.search("/^Run/"), (NodeIdList{20}));
    EXPECT_TRUE(engine.search("/^nomatch$/").empty());
    EXPECT_THROW(engine.search("/[unclosed/"), InvalidQueryError);
}

TEST(QueryEngineTests, SearchBySubstring)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.search("GCRuntime"), (NodeIdList{10}));
    EXPECT_EQ(engine.search("ni"), (NodeIdList{30, 31}));
    EXPECT_TRUE(engine.search("zzz").empty());
    EXPECT_THROW(engine.search(""), InvalidQueryError);
}

// ============================================================================
// Route
// ============================================================================

TEST(QueryEngineTests, RouteHonoursAvoidSetsAndLimits)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    EXPECT_EQ(engine.route(30, {10}, {}), (NodeIdList{30, 20, 15, 10}));
    EXPECT_EQ(engine.route(30, {10, 40}, {}), (NodeIdList{30, 20, 40}));
    EXPECT_TRUE(engine.route(30, {10}, {15}).empty());

    RouteOptions options;
    options.avoid_limits = LIMIT_SUPPRESS_GC;
    EXPECT_EQ(engine.route(30, {10, 40}, {}, options), (NodeIdList{30, 20, 15, 10}));
    EXPECT_TRUE(engine.route(30, {10, 40}, {15}, options).empty());
    EXPECT_THROW(engine.route(30, {63234}, {}), UnknownNodeError);
}

TEST(QueryEngineTests, ConcurrentReadersSeeSameAnswers)
{
    QueryEngine engine;
    load_string(engine, kHazardGraph);

    const NodeIdList expected_route{30, 20, 15, 10};
    const NodeIdList expected_search{10, 40};
    constexpr int kThreads = 8;
    std::vector<int> failures(kThreads, 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                if (engine.route(30, {10}, {}) != expected_route)
                    failures[t]++;
                if (engine.search("collect") != expected_search)
                    failures[t]++;
                if (engine.resolve("init") != NodeIdList{30, 31})
                    failures[t]++;
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(failures[t], 0) << "thread " << t;
    }
}

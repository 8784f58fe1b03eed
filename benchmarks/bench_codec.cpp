#include <benchmark/benchmark.h>
#include "toolwire/codec.hpp"
#include "toolwire/error.hpp"
#include "toolwire/types.hpp"
#include <string>

using namespace toolwire;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"calculate","arguments":{"operation":"multiply","a":6,"b":7}}})";

// tools/list response carrying n tools
static std::string make_tools_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

static const std::string kToolsList = make_tools_list(100);

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseToolsList(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsList);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_ParseToolsList);

static void BM_ParseTruncated(benchmark::State& state) {
    const std::string bad = kToolCall.substr(0, kToolCall.size() / 2);
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.id);
        }
    }
}
BENCHMARK(BM_ParseTruncated);

static void BM_SerializeToolResult(benchmark::State& state) {
    CallToolResult result = CallToolResult::text("Hello, Ada! This is your MCP server speaking.");
    auto resp = make_result(RequestId{int64_t{7}}, nlohmann::json(result));
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolResult);

static void BM_SerializeToolsList(benchmark::State& state) {
    auto msg = Codec::parse(kToolsList);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_SerializeToolsList);

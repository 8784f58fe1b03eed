#include <benchmark/benchmark.h>
#include "toolwire/schema.hpp"

using namespace toolwire;
using nlohmann::json;

static const json kCalculator = {
    {"type", "object"},
    {"properties", {
        {"operation", {{"type", "string"}, {"enum", {"add", "subtract", "multiply", "divide"}}}},
        {"a", {{"type", "number"}}},
        {"b", {{"type", "number"}}}
    }},
    {"required", {"operation", "a", "b"}},
    {"additionalProperties", false}
};

// Registered tools compile their schema once; this is the per-call cost.
static void BM_ValidateConforming(benchmark::State& state) {
    const SchemaValidator validator(kCalculator);
    const json args = {{"operation", "multiply"}, {"a", 6}, {"b", 7}};
    for (auto _ : state) {
        auto r = validator.validate(args);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ValidateConforming);

static void BM_CompileAndValidate(benchmark::State& state) {
    const json args = {{"operation", "multiply"}, {"a", 6}, {"b", 7}};
    for (auto _ : state) {
        auto r = SchemaValidator::validate(kCalculator, args);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_CompileAndValidate);

static void BM_RejectLongPatternSubject(benchmark::State& state) {
    const json schema = {
        {"type", "object"},
        {"properties", {{"name", {{"type", "string"}, {"pattern", "^[a-z]+$"}}}}}
    };
    const SchemaValidator validator(schema);
    const json args = {{"name", std::string(1 << 20, 'a')}};
    for (auto _ : state) {
        auto r = validator.validate(args);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_RejectLongPatternSubject);

static void BM_ValidateViolations(benchmark::State& state) {
    const SchemaValidator validator(kCalculator);
    const json args = {{"operation", "modulo"}, {"a", "6"}, {"extra", true}};
    for (auto _ : state) {
        auto r = validator.validate(args);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ValidateViolations);

static void BM_ValidateArray(benchmark::State& state) {
    const json schema = {
        {"type", "array"},
        {"items", {{"type", "number"}}},
        {"uniqueItems", true}
    };
    const SchemaValidator validator(schema);
    json values = json::array();
    for (int64_t i = 0; i < state.range(0); ++i) values.push_back(i);
    for (auto _ : state) {
        auto r = validator.validate(values);
        benchmark::DoNotOptimize(r);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_ValidateArray)->Range(8, 1024)->Complexity();

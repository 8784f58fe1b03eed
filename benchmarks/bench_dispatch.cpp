#include <benchmark/benchmark.h>
#include "toolwire/dispatcher.hpp"
#include "toolwire/log.hpp"
#include "toolwire/router.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace toolwire;

static Session& ready(Session& session) {
    session.advance(SessionState::Initializing);
    session.advance(SessionState::Ready);
    return session;
}

static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>(log::null_logger());
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const JsonRpcRequest&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("ping", [](const JsonRpcRequest&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

static void BM_RouteKnownMethod(benchmark::State& state) {
    auto router = make_router(1);
    Session session;
    ready(session);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouteKnownMethod);

static void BM_RouteUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    Session session;
    ready(session);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouteUnknownMethod);

static void BM_Route100Methods(benchmark::State& state) {
    auto router = make_router(100);
    Session session;
    ready(session);

    std::vector<JsonRpcRequest> requests;
    for (int i = 0; i < 100; ++i) {
        JsonRpcRequest req;
        req.id = RequestId{int64_t{i}};
        req.method = "method_" + std::to_string(i);
        requests.push_back(req);
    }

    size_t i = 0;
    for (auto _ : state) {
        auto resp = router->dispatch(requests[i % 100], session);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Route100Methods);

// Full tools/call path: validation, worker pool hop, response.
static void BM_CallTool(benchmark::State& state) {
    Session session;
    ToolDefinition def;
    def.name = "say_hello";
    def.input_schema = {
        {"type", "object"},
        {"properties", {{"name", {{"type", "string"}}}}},
        {"required", {"name"}}
    };
    session.tools().add(ToolDescriptor{def, make_async([](const nlohmann::json& args) {
        return CallToolResult::text("Hello, " + args.at("name").get<std::string>() + "!");
    }), std::nullopt});

    std::atomic<int64_t> answered{0};
    Dispatcher::Options opts;
    opts.logger = log::null_logger();
    opts.worker_threads = static_cast<size_t>(state.range(0));
    Dispatcher dispatcher(session, [&answered](const JsonRpcMessage&) { ++answered; }, opts);
    ready(session);

    JsonRpcRequest req;
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "say_hello"}, {"arguments", {{"name", "Ada"}}}};

    int64_t id = 0;
    for (auto _ : state) {
        req.id = RequestId{id++};
        dispatcher.handle(req);
    }
    while (answered.load() < id) std::this_thread::yield();
    state.SetItemsProcessed(id);
}
BENCHMARK(BM_CallTool)->Arg(1)->Arg(4)->UseRealTime();

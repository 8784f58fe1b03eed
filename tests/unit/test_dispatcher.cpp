#include <gtest/gtest.h>
#include "toolwire/dispatcher.hpp"
#include "toolwire/codec.hpp"
#include "toolwire/log.hpp"
#include "capture_sink.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace toolwire;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

JsonRpcRequest request(RequestId id, const std::string& method,
                       std::optional<json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

JsonRpcRequest call(int64_t id, const std::string& tool, json arguments = json::object()) {
    return request(RequestId{id}, "tools/call", json{{"name", tool}, {"arguments", arguments}});
}

JsonRpcNotification notification(const std::string& method,
                                 std::optional<json> params = std::nullopt) {
    JsonRpcNotification n;
    n.method = method;
    n.params = std::move(params);
    return n;
}

json init_params(const std::string& version = "2025-06-18") {
    return json{
        {"protocolVersion", version},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}
    };
}

std::string text_of(const JsonRpcResponse& resp) {
    return resp.result->at("content").at(0).at("text").get<std::string>();
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        gate_ = release_.get_future().share();

        ToolDefinition hello;
        hello.name = "say_hello";
        hello.description = "Say hello to someone";
        hello.input_schema = {
            {"type", "object"},
            {"properties", {{"name", {{"type", "string"}}}}},
            {"required", {"name"}}
        };
        add(hello, [](const json& args) {
            return CallToolResult::text("Hello, " + args.at("name").get<std::string>() +
                                        "! This is your MCP server speaking.");
        });

        ToolDefinition stuck;
        stuck.name = "stuck";
        auto gate = gate_;
        add(stuck, [gate](const json&) {
            gate.wait();
            return CallToolResult::text("released");
        });
    }

    void TearDown() override {
        release();
        dispatcher_.reset();
    }

    void add(ToolDefinition def, ToolHandler handler,
             std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        session_.tools().add(ToolDescriptor{std::move(def), make_async(std::move(handler)), timeout});
    }

    Dispatcher& start(Dispatcher::Options opts = {}) {
        opts.logger = log::null_logger();
        dispatcher_ = std::make_unique<Dispatcher>(
            session_, [this](const JsonRpcMessage& m) { sink_(m); }, std::move(opts));
        return *dispatcher_;
    }

    Dispatcher& start_ready(Dispatcher::Options opts = {}) {
        auto& d = start(std::move(opts));
        d.handle(request(RequestId{std::string("init")}, "initialize", init_params()));
        d.handle(notification("notifications/initialized"));
        EXPECT_EQ(session_.state(), SessionState::Ready);
        return d;
    }

    void release() {
        if (!released_.exchange(true)) release_.set_value();
    }

    Session session_;
    test::CaptureSink sink_;
    std::promise<void> release_;
    std::shared_future<void> gate_;
    std::atomic<bool> released_{false};
    std::unique_ptr<Dispatcher> dispatcher_;
};

} // namespace

// ---- Lifecycle ----

TEST_F(DispatcherTest, InitializeHandshake) {
    Dispatcher::Options opts;
    opts.server_info = Implementation{"hello-world-mcp", std::nullopt, "1.0.0"};
    opts.instructions = "Say hello";
    auto& d = start(opts);

    d.handle(request(RequestId{int64_t{1}}, "initialize", init_params()));
    auto resp = sink_.response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(resp->result->at("protocolVersion"), "2025-06-18");
    EXPECT_EQ(resp->result->at("serverInfo").at("name"), "hello-world-mcp");
    EXPECT_EQ(resp->result->at("capabilities").at("tools").at("listChanged"), false);
    EXPECT_EQ(resp->result->at("instructions"), "Say hello");
    EXPECT_EQ(session_.state(), SessionState::Initializing);
    ASSERT_TRUE(session_.client_info().has_value());
    EXPECT_EQ(session_.client_info()->name, "test-client");

    d.handle(notification("notifications/initialized"));
    EXPECT_EQ(session_.state(), SessionState::Ready);
    EXPECT_TRUE(session_.tools().frozen());
}

TEST_F(DispatcherTest, OlderSupportedVersionIsEchoed) {
    auto& d = start();
    d.handle(request(RequestId{int64_t{1}}, "initialize", init_params("2024-11-05")));
    EXPECT_EQ(sink_.response(RequestId{int64_t{1}})->result->at("protocolVersion"), "2024-11-05");
    EXPECT_EQ(session_.protocol_version(), "2024-11-05");
}

TEST_F(DispatcherTest, UnknownVersionGetsLatest) {
    auto& d = start();
    d.handle(request(RequestId{int64_t{1}}, "initialize", init_params("1999-01-01")));
    EXPECT_EQ(sink_.response(RequestId{int64_t{1}})->result->at("protocolVersion"),
              std::string(PROTOCOL_VERSION));
}

TEST_F(DispatcherTest, InitializeWithoutVersionRejected) {
    auto& d = start();
    d.handle(request(RequestId{int64_t{1}}, "initialize", json{{"capabilities", json::object()}}));
    auto resp = sink_.response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InvalidParams);
    EXPECT_EQ(session_.state(), SessionState::NotConnected);

    d.handle(request(RequestId{int64_t{2}}, "initialize"));
    EXPECT_EQ(sink_.response(RequestId{int64_t{2}})->error->code, error::InvalidParams);
}

TEST_F(DispatcherTest, SecondInitializeRejected) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{2}}, "initialize", init_params()));
    auto resp = sink_.response(RequestId{int64_t{2}});
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InvalidRequest);
    EXPECT_EQ(session_.state(), SessionState::Ready);
}

TEST_F(DispatcherTest, RequestsBeforeInitializeRejected) {
    auto& d = start();
    d.handle(request(RequestId{int64_t{1}}, "tools/list"));
    d.handle(call(2, "say_hello", json{{"name", "Ada"}}));
    d.handle(request(RequestId{int64_t{3}}, "ping"));
    for (int64_t id = 1; id <= 3; ++id) {
        auto resp = sink_.response(RequestId{id});
        ASSERT_TRUE(resp.has_value()) << "id " << id;
        ASSERT_TRUE(resp->error.has_value());
        EXPECT_EQ(resp->error->code, error::InvalidRequest);
    }
    EXPECT_EQ(session_.state(), SessionState::NotConnected);
}

TEST_F(DispatcherTest, RequestsWhileInitializingRejected) {
    auto& d = start();
    d.handle(request(RequestId{int64_t{1}}, "initialize", init_params()));
    d.handle(request(RequestId{int64_t{2}}, "tools/list"));
    EXPECT_EQ(sink_.response(RequestId{int64_t{2}})->error->code, error::InvalidRequest);
}

TEST_F(DispatcherTest, InitializedBeforeInitializeIgnored) {
    auto& d = start();
    d.handle(notification("notifications/initialized"));
    EXPECT_EQ(session_.state(), SessionState::NotConnected);
    EXPECT_EQ(sink_.size(), 0u);
}

TEST_F(DispatcherTest, PingWhenReady) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{5}}, "ping"));
    auto resp = sink_.response(RequestId{int64_t{5}});
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(*resp->result, json::object());
}

TEST_F(DispatcherTest, UnknownMethodWhenReady) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{5}}, "resources/list"));
    EXPECT_EQ(sink_.response(RequestId{int64_t{5}})->error->code, error::MethodNotFound);
}

TEST_F(DispatcherTest, RegistrationAfterReadyThrows) {
    start_ready();
    ToolDefinition late;
    late.name = "late";
    EXPECT_THROW(add(late, [](const json&) { return CallToolResult::text(""); }),
                 McpRegistryError);
}

// ---- tools/list ----

TEST_F(DispatcherTest, ListToolsInRegistrationOrder) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{1}}, "tools/list"));
    auto resp = sink_.response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp->result.has_value());
    const auto& tools = resp->result->at("tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "say_hello");
    EXPECT_EQ(tools[0]["inputSchema"]["required"][0], "name");
    EXPECT_EQ(tools[1]["name"], "stuck");
    EXPECT_FALSE(resp->result->contains("nextCursor"));
}

TEST_F(DispatcherTest, ListToolsIsByteIdentical) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{1}}, "tools/list"));
    d.handle(request(RequestId{int64_t{2}}, "tools/list"));
    auto a = sink_.response(RequestId{int64_t{1}});
    auto b = sink_.response(RequestId{int64_t{2}});
    EXPECT_EQ(Codec::serialize(make_result(RequestId{int64_t{0}}, *a->result)),
              Codec::serialize(make_result(RequestId{int64_t{0}}, *b->result)));
}

TEST_F(DispatcherTest, ListToolsPaging) {
    Dispatcher::Options opts;
    opts.page_size = 1;
    auto& d = start_ready(opts);

    d.handle(request(RequestId{int64_t{1}}, "tools/list"));
    auto first = sink_.response(RequestId{int64_t{1}});
    ASSERT_EQ(first->result->at("tools").size(), 1u);
    EXPECT_EQ(first->result->at("tools")[0]["name"], "say_hello");
    ASSERT_TRUE(first->result->contains("nextCursor"));

    d.handle(request(RequestId{int64_t{2}}, "tools/list",
                     json{{"cursor", first->result->at("nextCursor")}}));
    auto second = sink_.response(RequestId{int64_t{2}});
    ASSERT_EQ(second->result->at("tools").size(), 1u);
    EXPECT_EQ(second->result->at("tools")[0]["name"], "stuck");
    EXPECT_FALSE(second->result->contains("nextCursor"));
}

TEST_F(DispatcherTest, InvalidCursorRejected) {
    Dispatcher::Options opts;
    opts.page_size = 1;
    auto& d = start_ready(opts);
    d.handle(request(RequestId{int64_t{1}}, "tools/list", json{{"cursor", "abc"}}));
    d.handle(request(RequestId{int64_t{2}}, "tools/list", json{{"cursor", "99"}}));
    d.handle(request(RequestId{int64_t{3}}, "tools/list", json{{"cursor", 1}}));
    for (int64_t id = 1; id <= 3; ++id) {
        EXPECT_EQ(sink_.response(RequestId{id})->error->code, error::InvalidParams) << "id " << id;
    }
}

TEST_F(DispatcherTest, CursorWithoutPagingRejected) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{1}}, "tools/list", json{{"cursor", "0"}}));
    EXPECT_EQ(sink_.response(RequestId{int64_t{1}})->error->code, error::InvalidParams);
}

// ---- tools/call ----

TEST_F(DispatcherTest, CallToolSucceeds) {
    auto& d = start_ready();
    d.handle(call(1, "say_hello", json{{"name", "Ada"}}));
    auto resp = sink_.wait_response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_NE(text_of(*resp).find("Ada"), std::string::npos);
    EXPECT_FALSE(resp->result->contains("isError"));
}

TEST_F(DispatcherTest, MissingRequiredArgument) {
    auto& d = start_ready();
    d.handle(call(2, "say_hello"));
    auto resp = sink_.wait_response(RequestId{int64_t{2}});
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InvalidParams);
    ASSERT_TRUE(resp->error->data.has_value());
    const auto& violations = resp->error->data->at("violations");
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0]["path"], "/name");
    EXPECT_EQ(violations[0]["keyword"], "required");
    EXPECT_EQ(d.in_flight(), 0u);
}

TEST_F(DispatcherTest, WrongArgumentType) {
    auto& d = start_ready();
    d.handle(call(3, "say_hello", json{{"name", 42}}));
    auto resp = sink_.wait_response(RequestId{int64_t{3}});
    EXPECT_EQ(resp->error->code, error::InvalidParams);
    EXPECT_EQ(resp->error->data->at("violations")[0]["keyword"], "type");
}

TEST_F(DispatcherTest, UnknownToolLeavesRegistryAlone) {
    auto& d = start_ready();
    d.handle(call(1, "unknown_tool"));
    auto resp = sink_.wait_response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::MethodNotFound);
    EXPECT_EQ(resp->error->data->at("name"), "unknown_tool");
    EXPECT_EQ(session_.tools().size(), 2u);
    EXPECT_FALSE(session_.tools().contains("unknown_tool"));
}

TEST_F(DispatcherTest, MalformedCallParams) {
    auto& d = start_ready();
    d.handle(request(RequestId{int64_t{1}}, "tools/call", json{{"arguments", json::object()}}));
    d.handle(request(RequestId{int64_t{2}}, "tools/call",
                     json{{"name", "say_hello"}, {"arguments", json::array()}}));
    d.handle(request(RequestId{int64_t{3}}, "tools/call", json::array()));
    d.handle(request(RequestId{int64_t{4}}, "tools/call"));
    for (int64_t id = 1; id <= 4; ++id) {
        auto resp = sink_.wait_response(RequestId{id});
        ASSERT_TRUE(resp.has_value()) << "id " << id;
        EXPECT_EQ(resp->error->code, error::InvalidParams) << "id " << id;
    }
}

TEST_F(DispatcherTest, DomainErrorIsASuccessfulResponse) {
    ToolDefinition div;
    div.name = "divide";
    add(div, [](const json&) { return CallToolResult::error_text("Division by zero"); });
    auto& d = start_ready();

    d.handle(call(1, "divide"));
    auto resp = sink_.wait_response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(resp->result->at("isError"), true);
    EXPECT_EQ(text_of(*resp), "Division by zero");
}

TEST_F(DispatcherTest, ProtocolErrorFromToolKeepsCode) {
    ToolDefinition t;
    t.name = "picky";
    add(t, [](const json&) -> CallToolResult {
        throw McpProtocolError(error::InvalidParams, "value out of range",
                               json{{"field", "n"}});
    });
    auto& d = start_ready();

    d.handle(call(1, "picky"));
    auto resp = sink_.wait_response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InvalidParams);
    EXPECT_EQ(resp->error->message, "value out of range");
    EXPECT_EQ(resp->error->data->at("field"), "n");
}

TEST_F(DispatcherTest, ToolExceptionBecomesGenericInternalError) {
    ToolDefinition t;
    t.name = "broken";
    add(t, [](const json&) -> CallToolResult {
        throw std::runtime_error("connection string postgres://secret");
    });
    auto& d = start_ready();

    d.handle(call(1, "broken"));
    auto resp = sink_.wait_response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::InternalError);
    EXPECT_EQ(resp->error->message, "Internal error");
    EXPECT_FALSE(resp->error->data.has_value());
}

TEST_F(DispatcherTest, FailedFutureFromAsyncHandler) {
    ToolDefinition t;
    t.name = "async_fail";
    session_.tools().add(ToolDescriptor{t, [](const json&) {
        return std::async(std::launch::deferred, []() -> CallToolResult {
            throw std::logic_error("bad state");
        });
    }, std::nullopt});
    auto& d = start_ready();

    d.handle(call(1, "async_fail"));
    EXPECT_EQ(sink_.wait_response(RequestId{int64_t{1}})->error->code, error::InternalError);
}

TEST_F(DispatcherTest, StructuredContentPassesThrough) {
    ToolDefinition t;
    t.name = "calc";
    add(t, [](const json&) {
        CallToolResult r = CallToolResult::text("4");
        r.structured_content = json{{"result", 4}};
        return r;
    });
    auto& d = start_ready();
    d.handle(call(1, "calc"));
    EXPECT_EQ(sink_.wait_response(RequestId{int64_t{1}})->result->at("structuredContent")["result"], 4);
}

TEST_F(DispatcherTest, DuplicateInFlightIdRejected) {
    auto& d = start_ready();
    d.handle(call(7, "stuck"));
    d.handle(call(7, "say_hello", json{{"name", "Ada"}}));

    auto dup = sink_.wait_response(RequestId{int64_t{7}});
    ASSERT_TRUE(dup->error.has_value());
    EXPECT_EQ(dup->error->code, error::InvalidRequest);
    EXPECT_EQ(d.in_flight(), 1u);

    release();
    ASSERT_TRUE(sink_.wait_for_count(3));
    EXPECT_EQ(sink_.count_for(RequestId{int64_t{7}}), 2u);
}

TEST_F(DispatcherTest, IntegerAndStringIdsAreDistinct) {
    auto& d = start_ready();
    d.handle(call(7, "stuck"));
    d.handle(request(RequestId{std::string("7")}, "tools/call",
                     json{{"name", "say_hello"}, {"arguments", {{"name", "Ada"}}}}));
    auto resp = sink_.wait_response(RequestId{std::string("7")});
    ASSERT_TRUE(resp->result.has_value());
}

TEST_F(DispatcherTest, StuckHandlerTimesOutWithoutBlockingOthers) {
    ToolDefinition slow;
    slow.name = "never_finishes";
    auto gate = gate_;
    add(slow, [gate](const json&) {
        gate.wait();
        return CallToolResult::text("too late");
    }, 2000ms);
    auto& d = start_ready();

    const auto t0 = std::chrono::steady_clock::now();
    d.handle(call(1, "never_finishes"));

    std::this_thread::sleep_for(100ms);
    d.handle(call(2, "say_hello", json{{"name", "Ada"}}));
    auto quick = sink_.wait_response(RequestId{int64_t{2}}, 1000ms);
    ASSERT_TRUE(quick.has_value());
    ASSERT_TRUE(quick->result.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1500ms);

    auto timed_out = sink_.wait_response(RequestId{int64_t{1}}, 5000ms);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    ASSERT_TRUE(timed_out.has_value());
    ASSERT_TRUE(timed_out->error.has_value());
    EXPECT_EQ(timed_out->error->code, error::InternalError);
    EXPECT_EQ(timed_out->error->data->at("reason"), "timeout");
    EXPECT_EQ(timed_out->error->data->at("timeoutMs"), 2000);
    EXPECT_GE(elapsed, 1900ms);
    EXPECT_LT(elapsed, 3500ms);

    // The late result must not produce a second response.
    release();
    d.handle(call(3, "say_hello", json{{"name", "Bob"}}));
    ASSERT_TRUE(sink_.wait_response(RequestId{int64_t{3}}).has_value());
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(sink_.count_for(RequestId{int64_t{1}}), 1u);
}

TEST_F(DispatcherTest, TimedOutHandlersDoNotStarveThePool) {
    ToolDefinition wedged;
    wedged.name = "wedged";
    auto gate = gate_;
    add(wedged, [gate](const json&) {
        gate.wait();
        return CallToolResult::text("too late");
    }, 300ms);

    ToolDefinition quick;
    quick.name = "quick";
    add(quick, [](const json&) { return CallToolResult::text("done"); }, 2000ms);

    Dispatcher::Options opts;
    opts.worker_threads = 2;
    auto& d = start_ready(opts);

    // Both workers end up inside handlers that never return.
    d.handle(call(1, "wedged"));
    d.handle(call(2, "wedged"));
    ASSERT_TRUE(sink_.wait_response(RequestId{int64_t{1}}, 2000ms).has_value());
    ASSERT_TRUE(sink_.wait_response(RequestId{int64_t{2}}, 2000ms).has_value());

    std::this_thread::sleep_for(200ms);
    const auto t0 = std::chrono::steady_clock::now();
    d.handle(call(3, "quick"));
    auto resp = sink_.wait_response(RequestId{int64_t{3}}, 2000ms);
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->result.has_value()) << resp->error->message;
    EXPECT_EQ(text_of(*resp), "done");
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1000ms);
}

TEST_F(DispatcherTest, CallTimedOutWhileQueuedNeverRuns) {
    auto runs = std::make_shared<std::atomic<int>>(0);
    ToolDefinition counted;
    counted.name = "counted";
    add(counted, [runs](const json&) {
        ++*runs;
        return CallToolResult::text("ran");
    }, 100ms);

    ToolDefinition blocker;
    blocker.name = "blocker";
    auto gate = gate_;
    add(blocker, [gate](const json&) {
        gate.wait();
        return CallToolResult::text("released");
    });

    Dispatcher::Options opts;
    opts.worker_threads = 1;
    auto& d = start_ready(opts);

    // No deadline on the blocker, so its worker is never replaced.
    d.handle(call(1, "blocker"));
    std::this_thread::sleep_for(50ms);
    d.handle(call(2, "counted"));
    auto resp = sink_.wait_response(RequestId{int64_t{2}}, 2000ms);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->error->data->at("reason"), "timeout");

    release();
    ASSERT_TRUE(sink_.wait_response(RequestId{int64_t{1}}, 2000ms).has_value());
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(runs->load(), 0);
    EXPECT_EQ(sink_.count_for(RequestId{int64_t{2}}), 1u);
}

TEST_F(DispatcherTest, PerToolTimeoutOverridesDefault) {
    ToolDefinition slow;
    slow.name = "fast_deadline";
    auto gate = gate_;
    add(slow, [gate](const json&) {
        gate.wait();
        return CallToolResult::text("late");
    }, 50ms);
    Dispatcher::Options opts;
    opts.call_timeout = 10000ms;
    auto& d = start_ready(opts);

    d.handle(call(1, "fast_deadline"));
    auto resp = sink_.wait_response(RequestId{int64_t{1}}, 2000ms);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->error->data->at("timeoutMs"), 50);
}

TEST_F(DispatcherTest, DefaultTimeoutApplies) {
    Dispatcher::Options opts;
    opts.call_timeout = 100ms;
    auto& d = start_ready(opts);
    d.handle(call(1, "stuck"));
    auto resp = sink_.wait_response(RequestId{int64_t{1}}, 2000ms);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->error->data->at("reason"), "timeout");
    EXPECT_EQ(d.in_flight(), 0u);
}

// ---- Malformed input ----

TEST_F(DispatcherTest, DecodeErrorThenContinues) {
    auto& d = start_ready();
    try {
        (void)Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"pi)");
        FAIL() << "expected McpParseError";
    } catch (const McpParseError& e) {
        d.handle_decode_error(e);
    }
    ASSERT_EQ(sink_.size(), 2u);  // initialize response + parse error
    const auto& err = std::get<JsonRpcResponse>(sink_.messages().back());
    EXPECT_FALSE(err.id.has_value());
    ASSERT_TRUE(err.error.has_value());
    EXPECT_EQ(err.error->code, error::ParseError);

    d.handle(request(RequestId{int64_t{2}}, "ping"));
    EXPECT_TRUE(sink_.response(RequestId{int64_t{2}})->result.has_value());
}

TEST_F(DispatcherTest, DecodeErrorKeepsRecoveredId) {
    auto& d = start_ready();
    d.handle_decode_error(McpParseError("bad envelope", RequestId{int64_t{11}}));
    auto resp = sink_.response(RequestId{int64_t{11}});
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->error->code, error::ParseError);
}

// ---- Cancellation ----

TEST_F(DispatcherTest, CancellationSuppressesResponse) {
    Dispatcher::Options opts;
    opts.worker_threads = 1;
    auto& d = start_ready(opts);

    d.handle(call(1, "stuck"));
    EXPECT_EQ(d.in_flight(), 1u);
    d.handle(notification("notifications/cancelled",
                          json{{"requestId", 1}, {"reason", "user abort"}}));
    EXPECT_EQ(d.in_flight(), 0u);

    release();
    // Single worker: once this answers, the cancelled handler has finished too.
    d.handle(call(2, "say_hello", json{{"name", "Ada"}}));
    ASSERT_TRUE(sink_.wait_response(RequestId{int64_t{2}}).has_value());
    EXPECT_EQ(sink_.count_for(RequestId{int64_t{1}}), 0u);
}

TEST_F(DispatcherTest, CancellationOfUnknownIdIgnored) {
    auto& d = start_ready();
    const size_t before = sink_.size();
    d.handle(notification("notifications/cancelled", json{{"requestId", 999}}));
    d.handle(notification("notifications/cancelled", json{{"requestId", json::array()}}));
    d.handle(notification("notifications/cancelled"));
    EXPECT_EQ(sink_.size(), before);
}

TEST_F(DispatcherTest, CancellationAfterCompletionIsNoOp) {
    auto& d = start_ready();
    d.handle(call(1, "say_hello", json{{"name", "Ada"}}));
    ASSERT_TRUE(sink_.wait_response(RequestId{int64_t{1}}).has_value());
    d.handle(notification("notifications/cancelled", json{{"requestId", 1}}));
    EXPECT_EQ(sink_.count_for(RequestId{int64_t{1}}), 1u);
}

// ---- Shutdown ----

TEST_F(DispatcherTest, ShutdownRequest) {
    auto& d = start_ready();
    int callbacks = 0;
    d.set_shutdown_callback([&callbacks] { ++callbacks; });

    d.handle(request(RequestId{int64_t{9}}, "shutdown"));
    auto resp = sink_.response(RequestId{int64_t{9}});
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(session_.state(), SessionState::ShuttingDown);
    EXPECT_EQ(callbacks, 1);

    d.begin_shutdown();
    EXPECT_EQ(callbacks, 1);

    d.handle(request(RequestId{int64_t{10}}, "ping"));
    EXPECT_EQ(sink_.response(RequestId{int64_t{10}})->error->code, error::ConnectionClosing);
    d.handle(call(11, "say_hello", json{{"name", "Ada"}}));
    EXPECT_EQ(sink_.response(RequestId{int64_t{11}})->error->code, error::ConnectionClosing);
}

TEST_F(DispatcherTest, DrainWaitsForRunningCalls) {
    Dispatcher::Options opts;
    opts.shutdown_grace = 5000ms;
    auto& d = start_ready(opts);

    d.handle(call(1, "stuck"));
    d.begin_shutdown();

    std::thread releaser([this] {
        std::this_thread::sleep_for(100ms);
        release();
    });
    EXPECT_TRUE(d.wait_drained());
    releaser.join();

    auto resp = sink_.response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(text_of(*resp), "released");
}

TEST_F(DispatcherTest, DrainAbandonsCallsPastGrace) {
    Dispatcher::Options opts;
    opts.shutdown_grace = 100ms;
    auto& d = start_ready(opts);

    d.handle(call(1, "stuck"));
    d.begin_shutdown();
    EXPECT_FALSE(d.wait_drained());
    EXPECT_EQ(d.in_flight(), 0u);

    auto resp = sink_.response(RequestId{int64_t{1}});
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->error.has_value());
    EXPECT_EQ(resp->error->code, error::ConnectionClosing);
    EXPECT_EQ(resp->error->data->at("reason"), "shutdown");

    release();
    dispatcher_.reset();
    EXPECT_EQ(sink_.count_for(RequestId{int64_t{1}}), 1u);
}

TEST_F(DispatcherTest, DrainWhenIdle) {
    auto& d = start_ready();
    d.begin_shutdown();
    EXPECT_TRUE(d.wait_drained());
}

TEST_F(DispatcherTest, SinkFailureDoesNotEscape) {
    Dispatcher::Options opts;
    opts.logger = log::null_logger();
    dispatcher_ = std::make_unique<Dispatcher>(
        session_, [](const JsonRpcMessage&) { throw std::runtime_error("pipe closed"); },
        std::move(opts));
    EXPECT_NO_THROW(dispatcher_->handle(
        request(RequestId{int64_t{1}}, "initialize", init_params())));
    EXPECT_EQ(session_.state(), SessionState::Initializing);
}

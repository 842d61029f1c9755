#include <benchmark/benchmark.h>
#include "vlive/dispatcher.hpp"
#include "vlive/router.hpp"
#include "vlive/codec.hpp"
#include <memory>
#include <string>

using namespace vlive;

// Registry with N trivial tools spread over the non-core categories
static std::shared_ptr<ToolRegistry> make_registry(int n_tools) {
    auto registry = std::make_shared<ToolRegistry>();
    for (int i = 0; i < n_tools; ++i) {
        ToolDescriptor d;
        d.name = "tool_" + std::to_string(i);
        d.category = kAllCategories[1 + i % (kCategoryCount - 1)];
        d.input_schema.fields.push_back({"text", ArgType::String, true, std::nullopt, std::nullopt});
        d.input_schema.fields.push_back({"count", ArgType::Integer, false, nlohmann::json(1),
                                         std::nullopt});
        d.handler = [](const nlohmann::json& args, const CancellationToken&) {
            return nlohmann::json{{"echo", args.at("text")}};
        };
        registry->add(std::move(d));
    }
    registry->seal();
    return registry;
}

struct Fixture {
    explicit Fixture(int n_tools) : registry(make_registry(n_tools)) {
        Dispatcher::Options opts;
        opts.invocation_timeout = std::chrono::milliseconds(5000);
        dispatcher = std::make_unique<Dispatcher>(registry, opts);
        router = std::make_unique<Router>(*dispatcher, Router::Options{});
        session.assume_ready(std::string(PROTOCOL_VERSION));
    }

    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<Router> router;
    Session session;
};

static void BM_DispatchToolCall(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)));
    Request req{RequestId{int64_t{1}}, "tool_0", {{"text", "hallo"}}};

    for (auto _ : state) {
        auto result = f.dispatcher->dispatch(f.session, req);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchToolCall)->Arg(10)->Arg(100)->MinTime(1.0);

// Rejected before any handler thread is started
static void BM_DispatchValidationFailure(benchmark::State& state) {
    Fixture f(10);
    Request req{RequestId{int64_t{1}}, "tool_0", {{"text", 42}}};

    for (auto _ : state) {
        auto result = f.dispatcher->dispatch(f.session, req);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchValidationFailure)->MinTime(1.0);

static void BM_RouteUnknownMethod(benchmark::State& state) {
    Fixture f(1);
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";
    JsonRpcMessage msg = req;

    for (auto _ : state) {
        auto resp = f.router->handle(f.session, msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouteUnknownMethod)->MinTime(1.0);

static void BM_RouteToolsList(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)));
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";
    JsonRpcMessage msg = req;

    for (auto _ : state) {
        auto resp = f.router->handle(f.session, msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouteToolsList)->Arg(10)->Arg(100)->MinTime(1.0);

static void BM_RouteFullToolCall(benchmark::State& state) {
    Fixture f(10);
    const std::string raw =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"tool_3","arguments":{"text":"x"}}})";

    for (auto _ : state) {
        auto resp = f.router->handle(f.session, Codec::parse(raw));
        auto out = Codec::serialize(*resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_RouteFullToolCall)->MinTime(1.0);

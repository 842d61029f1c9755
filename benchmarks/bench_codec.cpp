#include <benchmark/benchmark.h>
#include "vlive/codec.hpp"
#include "vlive/json_rpc.hpp"
#include <string>

using namespace vlive;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_next_tram","arguments":{"stop":"Karlsplatz","line":"D","limit":3}}})";

// tools/list response with N descriptors
static std::string make_listing(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"category", "travel_manager"},
            {"description", "Looks something up for the traveller, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"stop", {{"type", "string"}}},
                    {"limit", {{"type", "integer"}, {"default", 3}}}
                }},
                {"required", {"stop"}},
                {"additionalProperties", false}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kListing = make_listing(100);

// ---- Parse ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseListing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kListing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kListing.size());
}
BENCHMARK(BM_ParseListing)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const FramingError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Decode / encode ----

static void BM_DecodeToolCall(benchmark::State& state) {
    auto msg = std::get<JsonRpcRequest>(Codec::parse(kToolCall));
    for (auto _ : state) {
        auto req = Codec::to_request(msg);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_DecodeToolCall)->MinTime(1.0);

static void BM_EncodeSuccess(benchmark::State& state) {
    Result result{RequestId{int64_t{42}},
                  Success{nlohmann::json{{"departures", {3, 8, 14}}, {"line", "D"}}}};
    for (auto _ : state) {
        auto s = Codec::serialize(Codec::to_response(result));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeSuccess)->MinTime(1.0);

static void BM_SerializeListing(benchmark::State& state) {
    auto msg = Codec::parse(kListing);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kListing.size());
}
BENCHMARK(BM_SerializeListing)->MinTime(1.0);

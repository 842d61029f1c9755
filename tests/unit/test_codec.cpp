#include <gtest/gtest.h>
#include "vlive/codec.hpp"
#include "vlive/error.hpp"
#include <vector>

using namespace vlive;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32001,"message":"Unknown tool: x","data":{"tool":"x"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::UnknownTool);
    EXPECT_EQ((*resp.error->data)["tool"], "x");
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    auto& notif = std::get<JsonRpcNotification>(msg);
    EXPECT_EQ(notif.method, "notifications/cancelled");
    EXPECT_EQ((*notif.params)["requestId"], 7);
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), FramingError);
}

TEST(CodecParse, TruncatedFrame) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"to)"), FramingError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), FramingError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), FramingError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), FramingError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":5})"), FramingError);
}

TEST(CodecParse, FractionalIdRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})"), FramingError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), FramingError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), FramingError);
    EXPECT_THROW(Codec::parse("\"hello\""), FramingError);
}

TEST(CodecParse, TrailingContentRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"} )"
                              R"({"jsonrpc":"2.0","id":2,"method":"ping"})"),
                 FramingError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"}x)"), FramingError);
    EXPECT_NO_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"}  )"));
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0"})"), FramingError);
}

TEST(CodecParse, LargeIntegersSurvive) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":9007199254740993,"method":"tools/call","params":{"name":"t","arguments":{"n":-42,"x":2.5}}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 9007199254740993LL);
    EXPECT_EQ((*req.params)["arguments"]["n"].get<int64_t>(), -42);
    EXPECT_DOUBLE_EQ((*req.params)["arguments"]["x"].get<double>(), 2.5);
}

// ---- Serialize ----

TEST(CodecSerialize, RequestIsCompactSingleLine) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{3}};
    req.method = "ping";
    auto s = Codec::serialize(req);
    EXPECT_EQ(s.find('\n'), std::string::npos);
    auto j = nlohmann::json::parse(s);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 3);
    EXPECT_FALSE(j.contains("params"));
}

TEST(CodecSerialize, StringWithNewlineIsEscaped) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string("r")};
    resp.result = nlohmann::json{{"text", "line one\nline two"}};
    auto s = Codec::serialize(resp);
    EXPECT_EQ(s.find('\n'), std::string::npos);
}

// ---- Request / Result mapping ----

TEST(CodecToRequest, ExtractsNameAndArguments) {
    JsonRpcRequest msg;
    msg.id = RequestId{std::string("call-1")};
    msg.method = "tools/call";
    msg.params = nlohmann::json{{"name", "add_expense"},
                                {"arguments", {{"amount", 12.5}, {"description", "Melange"}}}};
    auto req = Codec::to_request(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "call-1");
    EXPECT_EQ(req.tool_name, "add_expense");
    EXPECT_EQ(req.arguments["description"], "Melange");
}

TEST(CodecToRequest, MissingArgumentsBecomeEmptyObject) {
    JsonRpcRequest msg;
    msg.id = RequestId{int64_t{1}};
    msg.method = "tools/call";
    msg.params = nlohmann::json{{"name", "get_server_status"}};
    auto req = Codec::to_request(msg);
    EXPECT_TRUE(req.arguments.is_object());
    EXPECT_TRUE(req.arguments.empty());
}

TEST(CodecToRequest, MissingNameIsInvalidParams) {
    JsonRpcRequest msg;
    msg.id = RequestId{int64_t{1}};
    msg.method = "tools/call";
    msg.params = nlohmann::json{{"arguments", nlohmann::json::object()}};
    try {
        (void)Codec::to_request(msg);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
    }
}

TEST(CodecToRequest, NonObjectParamsIsInvalidParams) {
    JsonRpcRequest msg;
    msg.id = RequestId{int64_t{1}};
    msg.method = "tools/call";
    msg.params = nlohmann::json::array({"get_server_status"});
    EXPECT_THROW((void)Codec::to_request(msg), ProtocolError);
}

TEST(CodecToMessage, BuildsToolsCall) {
    Request req{RequestId{int64_t{9}}, "create_todo", {{"title", "Buy Sachertorte"}}};
    auto msg = Codec::to_message(req);
    EXPECT_EQ(msg.method, "tools/call");
    EXPECT_EQ((*msg.params)["name"], "create_todo");
    EXPECT_EQ(Codec::to_request(msg), req);
}

TEST(CodecToResponse, SuccessCarriesTextAndStructuredContent) {
    Result result{RequestId{int64_t{5}}, Success{nlohmann::json{{"minutes_until", 4}}}};
    auto resp = Codec::to_response(result);
    EXPECT_EQ(std::get<int64_t>(resp.id), 5);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
    const auto& r = *resp.result;
    EXPECT_EQ(r["isError"], false);
    EXPECT_EQ(r["structuredContent"]["minutes_until"], 4);
    ASSERT_EQ(r["content"].size(), 1u);
    EXPECT_EQ(r["content"][0]["type"], "text");
    EXPECT_EQ(nlohmann::json::parse(r["content"][0]["text"].get<std::string>()),
              result.success().payload);
}

TEST(CodecToResponse, FailureBecomesJsonRpcError) {
    Result result{RequestId{std::string("x")},
                  Failure{error::InvalidParams, "Missing required argument: title",
                          nlohmann::json{{"field", "title"}, {"reason", "missing"}}}};
    auto resp = Codec::to_response(result);
    EXPECT_FALSE(resp.result.has_value());
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ((*resp.error->data)["field"], "title");

    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "x");
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecToResult, InvertsToResponse) {
    Result ok{RequestId{int64_t{1}}, Success{nlohmann::json{{"a", 1}}}};
    Result bad{RequestId{int64_t{2}}, Failure{error::HandlerTimeout, "timed out", std::nullopt}};
    EXPECT_EQ(Codec::to_result(Codec::to_response(ok)), ok);
    EXPECT_EQ(Codec::to_result(Codec::to_response(bad)), bad);
}

TEST(CodecWire, RequestSurvivesTheWire) {
    std::vector<Request> requests = {
        {RequestId{int64_t{42}}, "search_plex_library",
         {{"query", "Kaiserin Sisi"}, {"limit", 5}, {"filters", {{"year", nlohmann::json::array({1955, 1957})}}}}},
        {RequestId{std::string("req-ö-7")}, "get_server_status", nlohmann::json::object()},
        {RequestId{int64_t{-1}}, "convert_currency", {{"amount", 12.75}, {"to", "USD"}, {"round", true}}},
    };
    for (const auto& req : requests) {
        auto wire = Codec::serialize(Codec::to_message(req));
        auto msg = Codec::parse(wire);
        ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg)) << wire;
        EXPECT_EQ(Codec::to_request(std::get<JsonRpcRequest>(msg)), req) << wire;
    }
}

TEST(CodecWire, ResultSurvivesTheWire) {
    std::vector<Result> results = {
        {RequestId{int64_t{1}}, Success{nlohmann::json{{"departures", {{{"line", "U4"}, {"in", 3}}}}}}},
        {RequestId{std::string("abc")}, Success{nlohmann::json::object()}},
        {RequestId{int64_t{2}}, Failure{error::HandlerTimeout, "Tool 'x' timed out",
                                        nlohmann::json{{"timeout_ms", 100}}}},
        {RequestId{std::string("z")}, Failure{error::UnknownTool, "Unknown tool: y", std::nullopt}},
    };
    for (const auto& result : results) {
        auto wire = Codec::serialize(Codec::to_response(result));
        auto msg = Codec::parse(wire);
        ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg)) << wire;
        EXPECT_EQ(Codec::to_result(std::get<JsonRpcResponse>(msg)), result) << wire;
    }
}

TEST(CodecToResult, EmptyResponseIsFramingError) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    EXPECT_THROW((void)Codec::to_result(resp), FramingError);
}

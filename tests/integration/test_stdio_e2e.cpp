#include <gtest/gtest.h>
#include "vlive/server.hpp"
#include "vlive/error.hpp"
#include "vlive/transport/stdio_transport.hpp"
#include <poll.h>
#include <unistd.h>
#include <chrono>
#include <thread>

using namespace vlive;
using namespace std::chrono_literals;

// A Server on a StdioTransport whose stdin/stdout are pipes held by the test.
class StdioServerFixture {
public:
    explicit StdioServerFixture(StdioTransport::Options topts = {},
                                std::chrono::milliseconds timeout = 2000ms) {
        if (::pipe(c2s_) < 0 || ::pipe(s2c_) < 0) throw std::runtime_error("pipe failed");

        sink_ = std::make_shared<MemorySink>();
        Server::Options sopts;
        sopts.server_info = {"stdio-e2e", std::nullopt, "1.0"};
        sopts.dispatch.invocation_timeout = timeout;
        sopts.logger = std::make_shared<Logger>(sink_, LogLevel::Debug);
        server_ = std::make_unique<Server>(sopts);

        ToolDescriptor sleep;
        sleep.name = "sleep_then_echo";
        sleep.category = Category::Planning;
        sleep.input_schema.fields = {
            {"label", ArgType::String, true, std::nullopt, std::nullopt},
            {"ms", ArgType::Integer, false, nlohmann::json(0), std::nullopt}
        };
        sleep.handler = [](const nlohmann::json& args, const CancellationToken& cancel) {
            cancel.wait_for(std::chrono::milliseconds(args.at("ms").get<int64_t>()));
            return nlohmann::json{{"label", args.at("label")}};
        };
        server_->add_tool(std::move(sleep));

        auto transport = std::make_unique<StdioTransport>(c2s_[0], s2c_[1], topts);
        thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_->serve(std::move(t));
        });
    }

    ~StdioServerFixture() {
        server_->shutdown();
        close_input();
        if (thread_.joinable()) thread_.join();
        ::close(s2c_[0]);
    }

    void send(const std::string& raw) {
        size_t off = 0;
        while (off < raw.size()) {
            ssize_t n = ::write(c2s_[1], raw.data() + off, raw.size() - off);
            if (n <= 0) throw std::runtime_error("write failed");
            off += static_cast<size_t>(n);
        }
    }

    void send(const nlohmann::json& j) { send(j.dump() + "\n"); }

    std::optional<nlohmann::json> receive(std::chrono::milliseconds timeout = 3000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                auto line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                return nlohmann::json::parse(line);
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;
            struct pollfd pfd{s2c_[0], POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) return std::nullopt;
            char chunk[4096];
            ssize_t n = ::read(s2c_[0], chunk, sizeof(chunk));
            if (n <= 0) return std::nullopt;
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    void initialize() {
        send(nlohmann::json{
            {"jsonrpc", "2.0"}, {"id", 0}, {"method", "initialize"},
            {"params", {{"protocolVersion", "2025-06-18"},
                        {"capabilities", nlohmann::json::object()},
                        {"clientInfo", {{"name", "e2e"}, {"version", "1"}}}}}});
        auto resp = receive();
        if (!resp || !resp->contains("result")) throw std::runtime_error("initialize failed");
        send(nlohmann::json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    }

    static nlohmann::json call(const nlohmann::json& id, const std::string& label, int ms) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                {"params", {{"name", "sleep_then_echo"},
                            {"arguments", {{"label", label}, {"ms", ms}}}}}};
    }

    void close_input() {
        if (c2s_[1] >= 0) {
            ::close(c2s_[1]);
            c2s_[1] = -1;
        }
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    MemorySink& sink() { return *sink_; }

private:
    int c2s_[2]{-1, -1};
    int s2c_[2]{-1, -1};
    std::shared_ptr<MemorySink> sink_;
    std::unique_ptr<Server> server_;
    std::thread thread_;
    std::string buffer_;
};

TEST(StdioE2E, FullSession) {
    StdioServerFixture f;
    f.initialize();

    f.send(nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    auto list = f.receive();
    ASSERT_TRUE(list.has_value());
    const auto& tools = (*list)["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "get_server_status");
    EXPECT_EQ(tools[1]["name"], "get_portmanteau_info");
    EXPECT_EQ(tools[2]["name"], "sleep_then_echo");

    f.send(StdioServerFixture::call(2, "hello", 0));
    auto call = f.receive();
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ((*call)["id"], 2);
    EXPECT_EQ((*call)["result"]["structuredContent"]["label"], "hello");

    f.send(nlohmann::json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                          {"params", {{"name", "get_portmanteau_info"},
                                      {"arguments", {{"portmanteau", "planning_manager"}}}}}});
    auto info = f.receive();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ((*info)["result"]["structuredContent"]["tools"][0], "sleep_then_echo");
}

TEST(StdioE2E, CallBeforeInitializeIsRejected) {
    StdioServerFixture f;
    const auto early = StdioServerFixture::call(1, "early", 0);
    f.send(early);
    auto resp = f.receive();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::ProtocolState);

    // The identical request succeeds once the handshake is done
    f.initialize();
    f.send(early);
    auto retried = f.receive();
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ((*retried)["id"], 1);
    EXPECT_EQ((*retried)["result"]["structuredContent"]["label"], "early");
}

TEST(StdioE2E, ResponsesFollowRequestOrderAtDepthOne) {
    StdioServerFixture f;
    f.initialize();

    f.send(StdioServerFixture::call("A", "A", 50));
    f.send(StdioServerFixture::call("B", "B", 0));

    auto first = f.receive();
    auto second = f.receive();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ((*first)["id"], "A");
    EXPECT_EQ((*second)["id"], "B");
}

TEST(StdioE2E, PipelinedRequestsMayCompleteOutOfOrder) {
    StdioTransport::Options opts;
    opts.pipeline_depth = 4;
    StdioServerFixture f(opts);
    f.initialize();

    f.send(StdioServerFixture::call("slow", "slow", 400));
    f.send(StdioServerFixture::call("fast", "fast", 0));

    auto first = f.receive();
    auto second = f.receive();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    // Each response still carries its own request's id
    EXPECT_EQ((*first)["id"], "fast");
    EXPECT_EQ((*first)["result"]["structuredContent"]["label"], "fast");
    EXPECT_EQ((*second)["id"], "slow");
    EXPECT_EQ((*second)["result"]["structuredContent"]["label"], "slow");
}

TEST(StdioE2E, ParseErrorThenRecovery) {
    StdioServerFixture f;
    f.initialize();
    f.send(std::string("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\n"));
    auto err = f.receive();
    ASSERT_TRUE(err.has_value());
    EXPECT_TRUE((*err)["id"].is_null());
    EXPECT_EQ((*err)["error"]["code"], error::ParseError);

    f.send(nlohmann::json{{"jsonrpc", "2.0"}, {"id", 9}, {"method", "ping"}});
    auto ping = f.receive();
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ((*ping)["id"], 9);

    EXPECT_FALSE(f.sink().records_for("transport").empty());
}

TEST(StdioE2E, OversizedFrameThenRecovery) {
    StdioTransport::Options opts;
    opts.max_frame_bytes = 512;
    StdioServerFixture f(opts);
    f.initialize();

    f.send(StdioServerFixture::call(1, std::string(2000, 'x'), 0));
    auto err = f.receive();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ((*err)["error"]["code"], error::PayloadTooLarge);

    f.send(StdioServerFixture::call(2, "small", 0));
    auto ok = f.receive();
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ((*ok)["id"], 2);
}

TEST(StdioE2E, TimeoutDoesNotPoisonSession) {
    StdioServerFixture f({}, 100ms);
    f.initialize();

    auto start = std::chrono::steady_clock::now();
    f.send(StdioServerFixture::call(1, "stuck", 5000));
    auto timed_out = f.receive();
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(timed_out.has_value());
    EXPECT_EQ((*timed_out)["error"]["code"], error::HandlerTimeout);
    EXPECT_LT(elapsed, 1000ms);

    f.send(StdioServerFixture::call(2, "next", 0));
    auto next = f.receive();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ((*next)["result"]["structuredContent"]["label"], "next");
}

TEST(StdioE2E, EofStillAnswersReceivedRequests) {
    StdioServerFixture f;
    // Everything arrives at once, then input closes
    f.send(nlohmann::json{
        {"jsonrpc", "2.0"}, {"id", 0}, {"method", "initialize"},
        {"params", {{"protocolVersion", "2025-06-18"},
                    {"capabilities", nlohmann::json::object()},
                    {"clientInfo", {{"name", "pipe"}, {"version", "1"}}}}}}.dump() + "\n"
        + StdioServerFixture::call(1, "first", 50).dump() + "\n"
        + StdioServerFixture::call(2, "last", 0).dump());
    f.close_input();

    auto init = f.receive();
    auto first = f.receive();
    auto last = f.receive();
    ASSERT_TRUE(init.has_value());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ((*init)["id"], 0);
    EXPECT_TRUE(init->contains("result"));
    EXPECT_EQ((*first)["result"]["structuredContent"]["label"], "first");
    // The final line had no newline
    EXPECT_EQ((*last)["result"]["structuredContent"]["label"], "last");

    f.join();
    EXPECT_FALSE(f.receive(100ms).has_value());
}

TEST(StdioE2E, EofEndsServe) {
    StdioServerFixture f;
    f.initialize();
    f.close_input();
    f.join();
    auto server_events = f.sink().records_for("server");
    ASSERT_FALSE(server_events.empty());
    EXPECT_EQ(server_events.back().data["event"], "stopped");
}

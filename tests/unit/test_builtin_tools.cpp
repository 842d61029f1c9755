#include <gtest/gtest.h>
#include "vlive/builtin_tools.hpp"
#include "vlive/dispatcher.hpp"
#include "vlive/version.hpp"

using namespace vlive;

class BuiltinToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<ToolRegistry>();
        add_builtin_tools(*registry_, Implementation{"vienna-live-mcp", std::nullopt, "1.2.3"});
        add("get_next_tram", Category::Travel);
        add("get_travel_weather", Category::Travel);
        add("add_expense", Category::Expenses);
        registry_->seal();

        dispatcher_ = std::make_unique<Dispatcher>(registry_, Dispatcher::Options{});
        session_.assume_ready(std::string(PROTOCOL_VERSION));
    }

    void add(const std::string& name, Category category) {
        ToolDescriptor d;
        d.name = name;
        d.category = category;
        d.handler = [](const nlohmann::json&, const CancellationToken&) {
            return nlohmann::json::object();
        };
        registry_->add(std::move(d));
    }

    nlohmann::json call(const std::string& tool, nlohmann::json args) {
        auto result = dispatcher_->dispatch(session_, Request{int64_t{1}, tool, std::move(args)});
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.success().payload : nlohmann::json();
    }

    std::shared_ptr<ToolRegistry> registry_;
    std::unique_ptr<Dispatcher> dispatcher_;
    Session session_;
};

TEST_F(BuiltinToolsTest, RegisteredUnderCore) {
    auto core = registry_->in_category(Category::Core);
    ASSERT_EQ(core.size(), 2u);
    EXPECT_EQ(core[0]->name, "get_server_status");
    EXPECT_EQ(core[1]->name, "get_portmanteau_info");
}

TEST_F(BuiltinToolsTest, ServerStatus) {
    auto status = call("get_server_status", nlohmann::json::object());
    EXPECT_EQ(status["server"]["name"], "vienna-live-mcp");
    EXPECT_EQ(status["server"]["version"], "1.2.3");
    EXPECT_EQ(status["server"]["status"], "healthy");
    EXPECT_GE(status["server"]["uptime_seconds"].get<int64_t>(), 0);
    EXPECT_EQ(status["tools_count"], 5);
    EXPECT_EQ(status["portmanteaus"],
              (nlohmann::json{"travel_manager", "expenses_manager"}));
    EXPECT_EQ(status["protocol_versions"][0], std::string(PROTOCOL_VERSION));
}

TEST_F(BuiltinToolsTest, ServerStatusRejectsArguments) {
    auto result = dispatcher_->dispatch(session_, Request{int64_t{1}, "get_server_status",
                                                          {{"verbose", true}}});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure().code, error::InvalidParams);
}

TEST_F(BuiltinToolsTest, PortmanteauInfo) {
    auto info = call("get_portmanteau_info", {{"portmanteau", "travel_manager"}});
    EXPECT_EQ(info["portmanteau"], "travel_manager");
    EXPECT_EQ(info["description"], std::string(category_description(Category::Travel)));
    EXPECT_EQ(info["tools_count"], 2);
    EXPECT_EQ(info["tools"], (nlohmann::json{"get_next_tram", "get_travel_weather"}));
}

TEST_F(BuiltinToolsTest, EmptyPortmanteauIsKnown) {
    auto info = call("get_portmanteau_info", {{"portmanteau", "media_manager"}});
    EXPECT_EQ(info["tools_count"], 0);
    EXPECT_TRUE(info["tools"].empty());
}

TEST_F(BuiltinToolsTest, UnknownPortmanteauListsAvailable) {
    auto info = call("get_portmanteau_info", {{"portmanteau", "weather_manager"}});
    EXPECT_EQ(info["error"], "Unknown portmanteau: weather_manager");
    // Empty portmanteaus are listed too, since they are valid names to ask about
    EXPECT_EQ(info["available_portmanteaus"],
              (nlohmann::json{"shopping_manager", "travel_manager", "expenses_manager",
                              "media_manager", "planning_manager"}));
    for (const auto& name : info["available_portmanteaus"]) {
        auto listed = call("get_portmanteau_info", {{"portmanteau", name}});
        EXPECT_FALSE(listed.contains("error")) << name;
    }

    auto core = call("get_portmanteau_info", {{"portmanteau", "core"}});
    EXPECT_TRUE(core.contains("error"));
}

TEST_F(BuiltinToolsTest, PortmanteauArgumentRequired) {
    auto result = dispatcher_->dispatch(session_, Request{int64_t{1}, "get_portmanteau_info",
                                                          nlohmann::json::object()});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ((*result.failure().details)["field"], "portmanteau");
}

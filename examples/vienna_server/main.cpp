/// Vienna live server: one demo tool per portmanteau plus the core catalog tools.
/// Usage: ./vienna_server [config.json]
/// The config path may also come from VLIVE_CONFIG. Without one it serves stdio.

#include <vlive/vlive.hpp>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <vector>

namespace {

vlive::FieldSpec field(std::string name, vlive::ArgType type, bool required,
                       std::optional<nlohmann::json> default_value = std::nullopt) {
    return vlive::FieldSpec{std::move(name), type, required, std::move(default_value),
                            std::nullopt};
}

void add_demo_tools(vlive::Server& server) {
    using vlive::ArgType;
    using vlive::Category;
    using vlive::CancellationToken;

    // get_next_tram: mock departures for a stop
    vlive::ToolDescriptor tram;
    tram.name = "get_next_tram";
    tram.category = Category::Travel;
    tram.description = "Next tram, bus or metro departures from a station";
    tram.input_schema.fields = {
        field("station_name", ArgType::String, true),
        field("line", ArgType::String, false),
        field("limit", ArgType::Integer, false, 3)
    };
    tram.handler = [](const nlohmann::json& args, const CancellationToken&) {
        std::string line = args.contains("line") ? args.at("line").get<std::string>() : "U6";
        int64_t limit = args.at("limit").get<int64_t>();
        nlohmann::json departures = nlohmann::json::array();
        for (int64_t i = 0; i < limit; ++i) {
            departures.push_back({{"line", line},
                                  {"minutes_until", 2 + 5 * i},
                                  {"platform", "A"},
                                  {"is_realtime", true}});
        }
        return nlohmann::json{{"station", args.at("station_name")},
                              {"departures", departures}};
    };
    server.add_tool(std::move(tram));

    // compare_prices: schema given as JSON Schema
    vlive::ToolDescriptor prices;
    prices.name = "compare_prices";
    prices.category = Category::Shopping;
    prices.description = "Compare the price of an item across Viennese supermarkets";
    prices.input_schema = vlive::schema_from_json({
        {"type", "object"},
        {"properties", {
            {"item_name", {{"type", "string"}}},
            {"stores", {{"type", "array"}}}
        }},
        {"required", {"item_name"}}
    });
    prices.handler = [](const nlohmann::json& args, const CancellationToken&) {
        nlohmann::json stores = args.contains("stores")
            ? args.at("stores")
            : nlohmann::json{"Billa", "Spar", "Hofer"};
        nlohmann::json offers = nlohmann::json::array();
        double price = 1.99;
        for (const auto& s : stores) {
            offers.push_back({{"store", s}, {"price_eur", price}});
            price += 0.2;
        }
        return nlohmann::json{{"item", args.at("item_name")},
                              {"offers", offers},
                              {"best_store", offers.empty() ? nlohmann::json(nullptr)
                                                            : offers.front().at("store")}};
    };
    server.add_tool(std::move(prices));

    // add_expense: appends to an in-memory ledger
    struct Ledger {
        std::mutex mutex;
        std::vector<nlohmann::json> entries;
    };
    auto ledger = std::make_shared<Ledger>();

    vlive::ToolDescriptor expense;
    expense.name = "add_expense";
    expense.category = Category::Expenses;
    expense.description = "Record an expense in EUR";
    expense.input_schema.fields = {
        field("amount", ArgType::Number, true),
        field("description", ArgType::String, true),
        field("category", ArgType::String, true),
        field("store", ArgType::String, false)
    };
    expense.handler = [ledger](const nlohmann::json& args, const CancellationToken&) {
        if (args.at("amount").get<double>() <= 0) {
            throw vlive::HandlerError("Amount must be positive",
                                      nlohmann::json{{"amount", args.at("amount")}});
        }
        std::lock_guard<std::mutex> lock(ledger->mutex);
        nlohmann::json entry = args;
        entry["id"] = "exp_" + std::to_string(ledger->entries.size() + 1);
        ledger->entries.push_back(entry);
        return nlohmann::json{{"success", true}, {"expense", entry}};
    };
    server.add_tool(std::move(expense));

    vlive::ToolDescriptor plex;
    plex.name = "search_plex_library";
    plex.category = Category::Media;
    plex.description = "Search the Plex library";
    plex.input_schema.fields = {
        field("query", ArgType::String, true),
        field("media_type", ArgType::String, false, "all"),
        field("limit", ArgType::Integer, false, 10)
    };
    plex.handler = [](const nlohmann::json& args, const CancellationToken& cancel) {
        nlohmann::json results = nlohmann::json::array();
        int64_t limit = args.at("limit").get<int64_t>();
        for (int64_t i = 0; i < limit && !cancel.is_cancelled(); ++i) {
            results.push_back({{"title", args.at("query").get<std::string>() + " " + std::to_string(i + 1)},
                               {"type", args.at("media_type")}});
        }
        return nlohmann::json{{"query", args.at("query")}, {"results", results}};
    };
    server.add_tool(std::move(plex));

    vlive::ToolDescriptor todo;
    todo.name = "create_todo";
    todo.category = Category::Planning;
    todo.description = "Create a todo item";
    todo.input_schema.fields = {
        field("title", ArgType::String, true),
        field("priority", ArgType::String, false, "medium"),
        field("due_date", ArgType::String, false)
    };
    todo.handler = [](const nlohmann::json& args, const CancellationToken&) {
        nlohmann::json item = args;
        item["status"] = "pending";
        return nlohmann::json{{"success", true}, {"todo", item}};
    };
    server.add_tool(std::move(todo));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("VLIVE_CONFIG")) {
        config_path = env;
    }

    vlive::ServerConfig config;
    try {
        if (!config_path.empty()) config = vlive::load_config(config_path);
    } catch (const vlive::ConfigError& e) {
        std::cerr << "vienna_server: " << e.what() << "\n";
        return 2;
    }

    config.server.logger = std::make_shared<vlive::Logger>(
        std::make_shared<vlive::StderrSink>(), config.log_level);
    config.server.instructions = "Vienna daily-life assistant. Call get_server_status for an "
                                 "overview and get_portmanteau_info for a category.";

    try {
        vlive::Server server{config.server};
        add_demo_tools(server);

        // Blocks until stdin closes or the HTTP server stops
        if (config.transport == vlive::ServerConfig::Transport::Http) {
            server.serve_http(config.http);
        } else {
            server.serve_stdio(config.stdio);
        }
    } catch (const vlive::VliveError& e) {
        std::cerr << "vienna_server: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

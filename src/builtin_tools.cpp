#include "vlive/builtin_tools.hpp"
#include "vlive/version.hpp"
#include <chrono>

namespace vlive {

namespace {

nlohmann::json non_empty_portmanteaus(const ToolRegistry& registry) {
    nlohmann::json names = nlohmann::json::array();
    for (auto c : kAllCategories) {
        if (c == Category::Core) continue;
        if (!registry.in_category(c).empty()) names.push_back(std::string(category_to_string(c)));
    }
    return names;
}

// Every name get_portmanteau_info accepts, populated or not
nlohmann::json all_portmanteaus() {
    nlohmann::json names = nlohmann::json::array();
    for (auto c : kAllCategories) {
        if (c != Category::Core) names.push_back(std::string(category_to_string(c)));
    }
    return names;
}

} // anonymous namespace

void add_builtin_tools(ToolRegistry& registry, const Implementation& server_info) {
    const ToolRegistry* reg = &registry;
    auto started = std::chrono::steady_clock::now();

    ToolDescriptor status;
    status.name = "get_server_status";
    status.category = Category::Core;
    status.description = "Server health, version, uptime and catalog summary";
    status.handler = [reg, server_info, started](const nlohmann::json&, const CancellationToken&) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started);
        nlohmann::json versions = nlohmann::json::array();
        for (auto v : SUPPORTED_PROTOCOL_VERSIONS) versions.push_back(std::string(v));
        return nlohmann::json{
            {"server", {
                {"name", server_info.name},
                {"version", server_info.version},
                {"status", "healthy"},
                {"uptime_seconds", uptime.count()}
            }},
            {"protocol_versions", versions},
            {"portmanteaus", non_empty_portmanteaus(*reg)},
            {"tools_count", reg->size()}
        };
    };
    registry.add(std::move(status));

    ToolDescriptor info;
    info.name = "get_portmanteau_info";
    info.category = Category::Core;
    info.description = "Describe one portmanteau and list its tools";
    info.input_schema.fields.push_back(
        FieldSpec{"portmanteau", ArgType::String, true, std::nullopt,
                  std::string("Portmanteau name, e.g. \"travel_manager\"")});
    info.handler = [reg](const nlohmann::json& args, const CancellationToken&) {
        auto name = args.at("portmanteau").get<std::string>();
        auto category = category_from_string(name);
        if (!category || *category == Category::Core) {
            return nlohmann::json{
                {"error", "Unknown portmanteau: " + name},
                {"available_portmanteaus", all_portmanteaus()}
            };
        }
        nlohmann::json tools = nlohmann::json::array();
        auto members = reg->in_category(*category);
        for (const auto* t : members) tools.push_back(t->name);
        return nlohmann::json{
            {"portmanteau", name},
            {"description", std::string(category_description(*category))},
            {"tools_count", members.size()},
            {"tools", tools}
        };
    };
    registry.add(std::move(info));
}

} // namespace vlive

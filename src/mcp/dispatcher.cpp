#include "shockmcp/mcp/dispatcher.hpp"

#include "shockmcp/logging.hpp"
#include "shockmcp/util/json.hpp"
#include "shockmcp/version.hpp"

#include <sstream>
#include <type_traits>

namespace shockmcp::mcp
{

namespace
{
spdlog::logger& logger()
{
    static const auto instance = logging::get("dispatcher");
    return *instance;
}

Json text_result(const std::string& text, bool is_error)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
                {"isError", is_error}};
}

bool valid_id(const Json& id)
{
    return id.is_null() || id.is_string() || id.is_number_integer();
}
} // namespace

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

Dispatcher::Dispatcher(std::string server_name, std::string server_version, int safety_limit,
                       std::shared_ptr<client::DownstreamClient> downstream)
    : server_name_(std::move(server_name)), server_version_(std::move(server_version)),
      clamp_(safety_limit), catalog_(clamp_), translator_(clamp_),
      downstream_(std::move(downstream))
{
}

Json Dispatcher::initialize_result() const
{
    return Json{{"protocolVersion", MCP_PROTOCOL_VERSION},
                {"capabilities", {{"tools", {{"listChanged", false}}}}},
                {"serverInfo", {{"name", server_name_}, {"version", server_version_}}}};
}

Json Dispatcher::list_tools_result() const
{
    Json tools = Json::array();
    for (const auto& t : catalog_.list_tools())
        tools.push_back(t);
    return Json{{"tools", tools}};
}

std::string Dispatcher::format_success(ToolName tool, const tools::Translation& translation,
                                       int ceiling, const Json& downstream_body)
{
    std::ostringstream text;
    text << "Successfully executed " << to_string(tool) << " command on "
         << translation.commands.size() << " shocker(s).";

    if (!translation.adjustments.empty())
    {
        text << "\n\nSecurity adjustment (max shock intensity: " << ceiling << "):";
        for (const auto& a : translation.adjustments)
            text << "\n- Shocker " << a.target_id << ": intensity reduced from " << a.requested
                 << " to " << a.applied;
    }

    text << "\n\nResponse: " << util::json::dump_pretty(downstream_body);
    return text.str();
}

util::Result<Json> Dispatcher::call_tool(const Json& params) const
{
    using util::Result;

    auto name_it = params.find("name");
    if (name_it == params.end() || name_it->is_null())
        return Result<Json>::failure("Missing tool name");
    std::string name =
        name_it->is_string() ? name_it->get<std::string>() : util::json::dump(*name_it);

    auto tool = tool_name_from_string(name);
    if (!tool)
        return Result<Json>::failure("Unknown tool: " + name);

    Json arguments = params.value("arguments", Json::object());
    if (!arguments.is_object() || !arguments.contains("shockers") ||
        arguments["shockers"].is_null())
        return Result<Json>::failure("Missing 'shockers' parameter");

    auto translation = translator_.translate(*tool, arguments["shockers"]);
    if (!translation)
        return Result<Json>::failure(translation.error());

    const auto& t = translation.value();
    for (const auto& a : t.adjustments)
        logger().warn("SHOCK intensity for shocker {} reduced from {} to {}", a.target_id,
                      a.requested, a.applied);

    const std::string label = "MCP-" + name;
    logger().info("Sending {} control request(s) to OpenShock API", t.commands.size());
    auto outcome = downstream_->send(t.commands, label);

    return std::visit(
        [&](const auto& r) -> Result<Json>
        {
            using R = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<R, client::DownstreamOk>)
            {
                logger().info("OpenShock API request successful");
                return Result<Json>::success(text_result(
                    format_success(*tool, t, clamp_.effective_ceiling(), r.body), false));
            }
            else
            {
                std::string reason = r.status == 0
                                         ? r.body
                                         : "HTTP " + std::to_string(r.status) + ": " + r.body;
                logger().error("OpenShock API error: {}", reason);
                return Result<Json>::success(
                    text_result("Error executing " + name + " command: " + reason, true));
            }
        },
        outcome);
}

Json Dispatcher::handle(const Json& message) const
{
    Json id;
    try
    {
        if (!message.is_object())
            return jsonrpc_error(Json(), INVALID_REQUEST, "Invalid Request: expected an object");

        id = message.contains("id") ? message.at("id") : Json();
        if (!valid_id(id))
            return jsonrpc_error(Json(), INVALID_REQUEST, "Invalid Request: bad id");

        auto method_it = message.find("method");
        if (method_it == message.end() || !method_it->is_string())
            return jsonrpc_error(id, INVALID_REQUEST, "Invalid Request: missing method");
        const std::string method = method_it->get<std::string>();

        Json params = message.value("params", Json::object());
        if (params.is_null())
            params = Json::object();

        logger().info("Processing JSON-RPC request: {}", method);

        if (method == "initialize")
            return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", initialize_result()}};

        if (method == "tools/list")
            return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", list_tools_result()}};

        if (method == "tools/call")
        {
            if (!params.is_object())
                return jsonrpc_error(id, INTERNAL_ERROR,
                                     "Internal error: params must be an object");
            auto result = call_tool(params);
            if (!result)
            {
                logger().error("Error processing request: {}", result.error());
                return jsonrpc_error(id, INTERNAL_ERROR, "Internal error: " + result.error());
            }
            return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result.value()}};
        }

        logger().warn("Unknown method: {}", method);
        return jsonrpc_error(id, METHOD_NOT_FOUND, "Method not found: " + method);
    }
    catch (const std::exception& e)
    {
        logger().error("Error processing request: {}", e.what());
        return jsonrpc_error(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
    catch (...)
    {
        logger().error("Error processing request: unknown exception");
        return jsonrpc_error(id, INTERNAL_ERROR, "Internal error");
    }
}

McpHandler make_mcp_handler(std::shared_ptr<const Dispatcher> dispatcher)
{
    return [dispatcher](const Json& message) { return dispatcher->handle(message); };
}

} // namespace shockmcp::mcp

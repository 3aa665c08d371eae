#pragma once
#include "shockmcp/client/downstream.hpp"
#include "shockmcp/safety/clamp.hpp"
#include "shockmcp/tools/catalog.hpp"
#include "shockmcp/tools/translator.hpp"
#include "shockmcp/types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace shockmcp::mcp
{

// JSON-RPC error codes used in outbound envelopes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INTERNAL_ERROR = -32603;

using McpHandler = std::function<Json(const Json&)>;

/// Build a JSON-RPC error envelope echoing `id` (null stays null).
Json jsonrpc_error(const Json& id, int code, const std::string& message);

/// Routes one JSON-RPC message to initialize, tools/list or tools/call.
///
/// handle() never throws: unknown methods become -32601, and every failure raised while
/// handling (bad arguments, unexpected faults) becomes -32603 carrying the reason, or
/// plain `Internal error` when the thrown value is not a std::exception. A
/// failing OpenShock call is not an envelope error; it is a tools/call result with
/// `isError: true`.
class Dispatcher
{
  public:
    /**
     * @param server_name reported in initialize.serverInfo
     * @param server_version reported in initialize.serverInfo
     * @param safety_limit maximum SHOCK intensity, 0 = unlimited
     * @param downstream OpenShock client shared across requests
     */
    Dispatcher(std::string server_name, std::string server_version, int safety_limit,
               std::shared_ptr<client::DownstreamClient> downstream);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Json handle(const Json& message) const;

    Json initialize_result() const;
    Json list_tools_result() const;

    const std::string& server_name() const
    {
        return server_name_;
    }
    const std::string& server_version() const
    {
        return server_version_;
    }
    const safety::SafetyClamp& clamp() const
    {
        return clamp_;
    }

  private:
    util::Result<Json> call_tool(const Json& params) const;
    static std::string format_success(ToolName tool, const tools::Translation& translation,
                                      int ceiling, const Json& downstream_body);

    std::string server_name_;
    std::string server_version_;
    safety::SafetyClamp clamp_;
    tools::ToolCatalog catalog_;
    tools::CommandTranslator translator_;
    std::shared_ptr<client::DownstreamClient> downstream_;
};

/// Wrap a dispatcher as the handler type consumed by the HTTP server.
McpHandler make_mcp_handler(std::shared_ptr<const Dispatcher> dispatcher);

} // namespace shockmcp::mcp

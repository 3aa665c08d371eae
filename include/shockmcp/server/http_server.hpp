#pragma once
#include "shockmcp/mcp/dispatcher.hpp"
#include "shockmcp/types.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace shockmcp::server
{

/// Document served by GET / (name, version, tools, endpoints).
Json make_server_info(const mcp::Dispatcher& dispatcher, bool auth_configured);

/// Render one outbound envelope as a single SSE frame: "data: <json>\n\n".
std::string to_sse_frame(const Json& envelope);

/// HTTP front end for the MCP endpoint.
///
/// Routes:
/// - POST <mcp_path>: Bearer-authenticated JSON-RPC; answers 200 with one envelope
///   (SSE frame by default, bare JSON when the client only accepts application/json)
/// - GET <mcp_path>: 405
/// - GET /: server info
/// - GET /health: liveness
class HttpServerWrapper
{
  public:
    /**
     * @param handler JSON-RPC handler (see mcp::make_mcp_handler)
     * @param server_info body for GET /; its "name" and "version" also feed /health
     * @param host Host address to bind to
     * @param port Port to listen on
     * @param auth_token Bearer token required on the MCP endpoint (empty = no auth)
     * @param mcp_path Path of the MCP endpoint
     */
    HttpServerWrapper(mcp::McpHandler handler, Json server_info, std::string host = "127.0.0.1",
                      int port = 8000, std::string auth_token = "",
                      std::string mcp_path = "/mcp");
    ~HttpServerWrapper();

    bool start();
    void stop();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }

  private:
    bool check_auth(const std::string& auth_header) const;

    mcp::McpHandler handler_;
    Json server_info_;
    std::string host_;
    int port_;
    std::string auth_token_;
    std::string mcp_path_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace shockmcp::server

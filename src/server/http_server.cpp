#include "shockmcp/server/http_server.hpp"

#include "shockmcp/logging.hpp"
#include "shockmcp/util/json.hpp"

#include <chrono>
#include <httplib.h>

namespace shockmcp::server
{

namespace
{
spdlog::logger& logger()
{
    static const auto instance = logging::get("http");
    return *instance;
}

// The bare JSON body is only chosen when the client explicitly asks for it and does not
// also accept an event stream.
bool wants_plain_json(const httplib::Request& req)
{
    auto accept = req.get_header_value("Accept");
    return accept.find("application/json") != std::string::npos &&
           accept.find("text/event-stream") == std::string::npos;
}
} // namespace

Json make_server_info(const mcp::Dispatcher& dispatcher, bool auth_configured)
{
    Json tool_names = Json::array();
    for (auto tool : ALL_TOOLS)
        tool_names.push_back(to_string(tool));
    return Json{{"name", dispatcher.server_name()},
                {"version", dispatcher.server_version()},
                {"protocol", "MCP"},
                {"tools", tool_names},
                {"auth_configured", auth_configured},
                {"max_shock_intensity", dispatcher.clamp().effective_ceiling()},
                {"endpoints",
                 {{"mcp", "POST /mcp"}, {"health", "GET /health"}, {"info", "GET /"}}}};
}

std::string to_sse_frame(const Json& envelope)
{
    return "data: " + util::json::dump(envelope) + "\n\n";
}

HttpServerWrapper::HttpServerWrapper(mcp::McpHandler handler, Json server_info, std::string host,
                                     int port, std::string auth_token, std::string mcp_path)
    : handler_(std::move(handler)), server_info_(std::move(server_info)), host_(std::move(host)),
      port_(port), auth_token_(std::move(auth_token)), mcp_path_(std::move(mcp_path))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

bool HttpServerWrapper::check_auth(const std::string& auth_header) const
{
    // If no auth token configured, allow all requests
    if (auth_token_.empty())
        return true;

    // Check for "Bearer <token>" format
    if (auth_header.find("Bearer ") != 0)
        return false;

    std::string provided_token = auth_header.substr(7); // Skip "Bearer "
    return provided_token == auth_token_;
}

bool HttpServerWrapper::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(1024 * 1024); // 1MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    svr_->Post(
        mcp_path_,
        [this](const httplib::Request& req, httplib::Response& res)
        {
            // Security: reject before any envelope processing
            if (!auth_token_.empty())
            {
                auto auth_it = req.headers.find("Authorization");
                if (auth_it == req.headers.end() || !check_auth(auth_it->second))
                {
                    logger().warn("Authentication failed for {}", req.remote_addr);
                    res.status = 401;
                    res.set_header("WWW-Authenticate", "Bearer");
                    res.set_content("{\"detail\":\"Invalid authentication token\"}",
                                    "application/json");
                    return;
                }
            }

            Json envelope;
            try
            {
                auto message = util::json::parse(req.body);
                envelope = handler_(message);
            }
            catch (const Json::parse_error& e)
            {
                logger().warn("Rejected malformed body: {}", e.what());
                envelope = mcp::jsonrpc_error(Json(), mcp::PARSE_ERROR, "Parse error");
            }
            catch (const std::exception& e)
            {
                logger().error("Handler failure: {}", e.what());
                envelope = mcp::jsonrpc_error(Json(), mcp::INTERNAL_ERROR,
                                              std::string("Internal error: ") + e.what());
            }

            // JSON-RPC errors are still 200 OK at HTTP level
            res.status = 200;
            if (wants_plain_json(req))
            {
                res.set_content(util::json::dump(envelope), "application/json");
                return;
            }
            res.set_header("Cache-Control", "no-cache");
            res.set_header("Connection", "keep-alive");
            res.set_content(to_sse_frame(envelope), "text/event-stream");
        });

    svr_->Get(mcp_path_,
              [](const httplib::Request&, httplib::Response& res)
              {
                  res.status = 405;
                  res.set_header("Allow", "POST");
                  Json error_response = {
                      {"error", "Method Not Allowed"},
                      {"message", "The MCP endpoint only supports POST requests."}};
                  res.set_content(error_response.dump(), "application/json");
              });

    svr_->Get("/",
              [this](const httplib::Request&, httplib::Response& res)
              { res.set_content(util::json::dump(server_info_), "application/json"); });

    svr_->Get("/health",
              [this](const httplib::Request&, httplib::Response& res)
              {
                  Json health = {{"status", "healthy"},
                                 {"server", server_info_.value("name", "")},
                                 {"version", server_info_.value("version", "")}};
                  res.set_content(util::json::dump(health), "application/json");
              });

    if (!svr_->bind_to_port(host_, port_))
    {
        logger().error("Failed to bind {}:{}", host_, port_);
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    svr_->wait_until_ready();

    logger().info("Listening on {}:{}{}", host_, port_, mcp_path_);
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace shockmcp::server

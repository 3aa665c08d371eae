/// @file http_integration.cpp
/// @brief MCP endpoint -> dispatcher -> OpenShockClient -> stand-in control API

#include "shockmcp/client/openshock_client.hpp"
#include "shockmcp/mcp/dispatcher.hpp"
#include "shockmcp/server/http_server.hpp"

#include <cassert>
#include <httplib.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace shockmcp;

static Json parse_sse(const std::string& body)
{
    // Exactly one frame: "data: <json>\n\n"
    assert(body.rfind("data: ", 0) == 0);
    assert(body.size() >= 2 && body.substr(body.size() - 2) == "\n\n");
    assert(body.find("data: ", 1) == std::string::npos);
    return Json::parse(body.substr(6, body.size() - 8));
}

int main()
{
    const int api_port = 18313;
    const int mcp_port = 18314;
    const std::string token = "client-token";

    // Stand-in control API
    std::mutex mutex;
    Json last_body;
    std::string last_token;
    int hits = 0;
    httplib::Server api;
    api.Post("/2/shockers/control",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 std::lock_guard<std::mutex> lock(mutex);
                 last_body = Json::parse(req.body);
                 last_token = req.get_header_value("OpenShockToken");
                 ++hits;
                 res.set_content("{\"message\":\"Successfully sent control messages\"}",
                                 "application/json");
             });
    std::thread api_thread([&]() { api.listen("127.0.0.1", api_port); });
    api.wait_until_ready();

    auto downstream = std::make_shared<client::OpenShockClient>(
        "http://127.0.0.1:" + std::to_string(api_port), "svc-token", 5);
    auto dispatcher =
        std::make_shared<mcp::Dispatcher>("integration", "0.9.0", 50, downstream);
    server::HttpServerWrapper http(mcp::make_mcp_handler(dispatcher),
                                   server::make_server_info(*dispatcher, true), "127.0.0.1",
                                   mcp_port, token);
    if (!http.start())
    {
        std::cerr << "failed to start HTTP server\n";
        api.stop();
        api_thread.join();
        return 1;
    }

    httplib::Client cli("127.0.0.1", mcp_port);
    httplib::Headers auth = {{"Authorization", "Bearer " + token}};

    // initialize as one SSE frame
    {
        auto res = cli.Post("/mcp", auth,
                            Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}.dump(),
                            "application/json");
        assert(res && res->status == 200);
        assert(res->get_header_value("Content-Type").find("text/event-stream") == 0);
        assert(res->get_header_value("Cache-Control") == "no-cache");
        auto env = parse_sse(res->body);
        assert(env["id"] == 1);
        assert(env["result"]["serverInfo"]["name"] == "integration");
    }

    // Plain JSON when the client only accepts JSON
    {
        httplib::Headers headers = auth;
        headers.emplace("Accept", "application/json");
        auto res = cli.Post("/mcp", headers,
                            Json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}.dump(),
                            "application/json");
        assert(res && res->status == 200);
        auto env = Json::parse(res->body);
        assert(env["result"]["tools"].size() == 4);
        assert(env["result"]["tools"][0]["inputSchema"]["properties"]["shockers"]["items"]
                  ["properties"]["intensity"]["maximum"] == 50);
    }

    // Clamped SHOCK reaches the API with the applied intensity
    {
        Json call = {{"jsonrpc", "2.0"},
                     {"id", "call-1"},
                     {"method", "tools/call"},
                     {"params",
                      {{"name", "SHOCK"},
                       {"arguments",
                        {{"shockers",
                          Json::array({{{"id", "x"}, {"intensity", 90}, {"duration", 1000}}})}}}}}};
        auto res = cli.Post("/mcp", auth, call.dump(), "application/json");
        assert(res && res->status == 200);
        auto env = parse_sse(res->body);
        assert(env["id"] == "call-1");
        auto text = env["result"]["content"][0]["text"].get<std::string>();
        assert(text.find("reduced from 90 to 50") != std::string::npos);

        std::lock_guard<std::mutex> lock(mutex);
        assert(hits == 1);
        assert(last_token == "svc-token");
        assert(last_body["customName"] == "MCP-SHOCK");
        assert(last_body["shocks"][0] ==
               (Json{{"id", "x"}, {"type", 1}, {"intensity", 50}, {"duration", 1000}}));
    }

    // Invalid arguments: envelope error, API untouched
    {
        Json call = {{"jsonrpc", "2.0"},
                     {"id", 4},
                     {"method", "tools/call"},
                     {"params", {{"name", "LASER"}, {"arguments", Json::object()}}}};
        auto res = cli.Post("/mcp", auth, call.dump(), "application/json");
        assert(res && res->status == 200);
        auto env = parse_sse(res->body);
        assert(env["error"]["code"] == -32603);
        assert(env["error"]["message"].get<std::string>().find("Unknown tool: LASER") !=
               std::string::npos);
        std::lock_guard<std::mutex> lock(mutex);
        assert(hits == 1);
    }

    // Unknown method
    {
        auto res = cli.Post("/mcp", auth,
                            Json{{"jsonrpc", "2.0"}, {"id", 5}, {"method", "ping"}}.dump(),
                            "application/json");
        assert(res && res->status == 200);
        assert(parse_sse(res->body)["error"]["code"] == -32601);
    }

    // Malformed body
    {
        auto res = cli.Post("/mcp", auth, "{not json", "application/json");
        assert(res && res->status == 200);
        auto env = parse_sse(res->body);
        assert(env["error"]["code"] == -32700);
        assert(env["id"].is_null());
    }

    // GET on the MCP endpoint
    {
        auto res = cli.Get("/mcp");
        assert(res && res->status == 405);
        assert(res->get_header_value("Allow") == "POST");
    }

    http.stop();
    api.stop();
    api_thread.join();
    return 0;
}

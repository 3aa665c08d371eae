#include "shockmcp/client/openshock_client.hpp"
#include "shockmcp/exceptions.hpp"
#include "shockmcp/logging.hpp"
#include "shockmcp/mcp/dispatcher.hpp"
#include "shockmcp/server/http_server.hpp"
#include "shockmcp/settings.hpp"
#include "shockmcp/util/json.hpp"
#include "shockmcp/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int)
{
    g_running = false;
}

int usage(int exit_code = 1)
{
    std::cout << "shockmcp-server " << shockmcp::VERSION_MAJOR << "." << shockmcp::VERSION_MINOR
              << "." << shockmcp::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  shockmcp-server [--config <file.json>]\n";
    std::cout << "  shockmcp-server --help | --version\n";
    std::cout << "\n";
    std::cout << "Environment (used when no --config is given):\n";
    std::cout << "  OPENSHOCK_API_TOKEN        OpenShock service token (required)\n";
    std::cout << "  MCP_AUTH_TOKEN             Bearer token clients must present (required)\n";
    std::cout << "  OPENSHOCK_API_URL          default https://api.openshock.app\n";
    std::cout << "  MAX_SHOCK_INTENSITY        SHOCK ceiling, 0 = unlimited (default 0)\n";
    std::cout << "  MCP_SERVER_NAME, MCP_VERSION, HOST, PORT, SHOCKMCP_LOG_LEVEL,\n";
    std::cout << "  OPENSHOCK_TIMEOUT_SECONDS\n";
    return exit_code;
}

shockmcp::Settings load_settings(const std::string& config_path)
{
    if (config_path.empty())
        return shockmcp::Settings::from_env();

    std::ifstream in(config_path);
    if (!in)
        throw shockmcp::ConfigError("Cannot open config file: " + config_path);
    std::stringstream buf;
    buf << in.rdbuf();
    try
    {
        return shockmcp::Settings::from_json(shockmcp::util::json::parse(buf.str()));
    }
    catch (const shockmcp::Json::exception& e)
    {
        throw shockmcp::ConfigError("Invalid config file " + config_path + ": " + e.what());
    }
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace shockmcp;

    std::string config_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return usage(0);
        if (arg == "--version")
        {
            std::cout << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH << "\n";
            return 0;
        }
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        return usage(1);
    }

    logging::configure("INFO");
    auto log = logging::get("main");

    Settings settings;
    try
    {
        settings = load_settings(config_path);
        logging::configure(settings.log_level);

        log->info("Starting {} v{}", settings.server_name, settings.server_version);
        log->info("OpenShock API URL: {}", settings.openshock_api_url);
        log->info("OpenShock API Token configured: {}",
                  settings.openshock_api_token.empty() ? "No" : "Yes");
        log->info("MCP Auth Token configured: {}", settings.mcp_auth_token.empty() ? "No" : "Yes");
        if (settings.max_shock_intensity == 0)
            log->info("Max shock intensity: unlimited");
        else
            log->info("Max shock intensity: {}", settings.max_shock_intensity);

        settings.validate();
    }
    catch (const Error& e)
    {
        log->error("{}", e.what());
        return 1;
    }

    std::shared_ptr<mcp::Dispatcher> dispatcher;
    try
    {
        auto downstream = std::make_shared<client::OpenShockClient>(
            settings.openshock_api_url, settings.openshock_api_token,
            settings.downstream_timeout_seconds);
        dispatcher = std::make_shared<mcp::Dispatcher>(settings.server_name,
                                                       settings.server_version,
                                                       settings.max_shock_intensity, downstream);
    }
    catch (const TransportError& e)
    {
        log->error("{}", e.what());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server::HttpServerWrapper http(mcp::make_mcp_handler(dispatcher),
                                   server::make_server_info(*dispatcher, true), settings.host,
                                   settings.port, settings.mcp_auth_token);
    if (!http.start())
        return 1;

    while (g_running && http.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    log->info("Shutting down");
    http.stop();
    return 0;
}

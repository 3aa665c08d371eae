#include "shockmcp/client/openshock_client.hpp"

#include "shockmcp/exceptions.hpp"
#include "shockmcp/logging.hpp"
#include "shockmcp/util/json.hpp"

#include <httplib.h>

namespace shockmcp::client
{

namespace
{
spdlog::logger& logger()
{
    static const auto instance = logging::get("openshock");
    return *instance;
}

struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string path; // "" or "/prefix" without trailing slash
};

ParsedUrl parse_url(const std::string& base)
{
    ParsedUrl result;
    std::string remaining = base;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
        throw TransportError("Unsupported URL scheme: " + result.scheme +
                             " (only http and https are allowed)");

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
    {
        result.path = remaining.substr(slash_pos);
        remaining = remaining.substr(0, slash_pos);
    }
    while (!result.path.empty() && result.path.back() == '/')
        result.path.pop_back();

    bool is_https = result.scheme == "https";
    auto colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos)
    {
        result.host = remaining.substr(0, colon_pos);
        try
        {
            result.port = std::stoi(remaining.substr(colon_pos + 1));
        }
        catch (const std::exception&)
        {
            result.port = is_https ? 443 : 80;
        }
    }
    else
    {
        result.host = remaining;
        result.port = is_https ? 443 : 80;
    }

    if (result.host.empty())
        throw TransportError("Missing host in URL: " + base);
    return result;
}
} // namespace

OpenShockClient::OpenShockClient(std::string base_url, std::string api_token,
                                 int timeout_seconds)
    : base_url_(std::move(base_url)), api_token_(std::move(api_token)),
      timeout_seconds_(timeout_seconds)
{
    auto url = parse_url(base_url_);
    origin_ = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    path_prefix_ = url.path;
}

DownstreamResult OpenShockClient::send(const std::vector<DownstreamCommand>& commands,
                                       const std::string& label)
{
    httplib::Client cli(origin_.c_str());
    cli.set_connection_timeout(timeout_seconds_, 0);
    cli.set_read_timeout(timeout_seconds_, 0);
    cli.set_write_timeout(timeout_seconds_, 0);

    // Security: never follow redirects with the service token attached
    cli.set_follow_location(false);

    httplib::Headers headers = {{"OpenShockToken", api_token_}, {"Accept", "application/json"}};
    const std::string path = path_prefix_ + CONTROL_PATH;
    const std::string body = util::json::dump(make_control_body(commands, label));

    logger().debug("POST {}{} ({} command(s), {})", origin_, path, commands.size(), label);

    auto res = cli.Post(path.c_str(), headers, body, "application/json");
    if (!res)
    {
        std::string reason = "HTTP request failed: " + httplib::to_string(res.error());
        logger().error("{}", reason);
        return DownstreamFail{0, reason};
    }
    if (res->status < 200 || res->status >= 300)
    {
        logger().error("OpenShock API returned HTTP {}", res->status);
        return DownstreamFail{res->status, res->body};
    }

    if (res->body.empty())
        return DownstreamOk{Json::object()};
    try
    {
        return DownstreamOk{util::json::parse(res->body)};
    }
    catch (const Json::parse_error&)
    {
        // Non-JSON success bodies are passed through as a string.
        return DownstreamOk{Json(res->body)};
    }
}

} // namespace shockmcp::client

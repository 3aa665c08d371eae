#include "shockmcp/settings.hpp"

#include "shockmcp/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace shockmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        int out = std::stoi(v, &pos);
        if (pos != std::string(v).size())
            throw ConfigError(std::string(key) + " must be an integer (got '" + v + "')");
        return out;
    }
    catch (const std::invalid_argument&)
    {
        throw ConfigError(std::string(key) + " must be an integer (got '" + v + "')");
    }
    catch (const std::out_of_range&)
    {
        throw ConfigError(std::string(key) + " is out of range (got '" + v + "')");
    }
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.openshock_api_url = getenv_str("OPENSHOCK_API_URL", s.openshock_api_url);
    s.openshock_api_token = getenv_str("OPENSHOCK_API_TOKEN", "");
    s.mcp_auth_token = getenv_str("MCP_AUTH_TOKEN", "");
    s.server_name = getenv_str("MCP_SERVER_NAME", s.server_name);
    s.server_version = getenv_str("MCP_VERSION", s.server_version);
    s.max_shock_intensity = getenv_int("MAX_SHOCK_INTENSITY", s.max_shock_intensity);
    s.host = getenv_str("HOST", s.host);
    s.port = getenv_int("PORT", s.port);
    s.log_level = upper(getenv_str("SHOCKMCP_LOG_LEVEL", s.log_level));
    s.downstream_timeout_seconds =
        getenv_int("OPENSHOCK_TIMEOUT_SECONDS", s.downstream_timeout_seconds);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("openshock_api_url"))
        s.openshock_api_url = j.at("openshock_api_url").get<std::string>();
    if (j.contains("openshock_api_token"))
        s.openshock_api_token = j.at("openshock_api_token").get<std::string>();
    if (j.contains("mcp_auth_token"))
        s.mcp_auth_token = j.at("mcp_auth_token").get<std::string>();
    if (j.contains("server_name"))
        s.server_name = j.at("server_name").get<std::string>();
    if (j.contains("server_version"))
        s.server_version = j.at("server_version").get<std::string>();
    if (j.contains("max_shock_intensity"))
        s.max_shock_intensity = j.at("max_shock_intensity").get<int>();
    if (j.contains("host"))
        s.host = j.at("host").get<std::string>();
    if (j.contains("port"))
        s.port = j.at("port").get<int>();
    if (j.contains("log_level"))
        s.log_level = upper(j.at("log_level").get<std::string>());
    if (j.contains("downstream_timeout_seconds"))
        s.downstream_timeout_seconds = j.at("downstream_timeout_seconds").get<int>();
    return s;
}

void Settings::validate() const
{
    if (openshock_api_token.empty())
        throw ConfigError("OPENSHOCK_API_TOKEN environment variable is required");
    if (mcp_auth_token.empty())
        throw ConfigError("MCP_AUTH_TOKEN environment variable is required");
    if (openshock_api_url.empty())
        throw ConfigError("OPENSHOCK_API_URL must not be empty");
    if (max_shock_intensity < 0)
        throw ConfigError("MAX_SHOCK_INTENSITY must be >= 0 (0 = unlimited)");
    if (port <= 0 || port > 65535)
        throw ConfigError("PORT must be between 1 and 65535");
    if (downstream_timeout_seconds <= 0)
        throw ConfigError("OPENSHOCK_TIMEOUT_SECONDS must be positive");
}

} // namespace shockmcp

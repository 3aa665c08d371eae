#pragma once
#include "shockmcp/types.hpp"

#include <string>

namespace shockmcp
{

struct Settings
{
    std::string openshock_api_url{"https://api.openshock.app"};
    std::string openshock_api_token;
    std::string mcp_auth_token;
    std::string server_name{"openshock-mcp-server"};
    std::string server_version{"1.0.0"};
    /// 0 means unlimited; values above 100 act as 100.
    int max_shock_intensity{0};
    std::string host{"0.0.0.0"};
    int port{8000};
    std::string log_level{"INFO"};
    int downstream_timeout_seconds{30};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Throws ConfigError when a credential is missing or a number is out of range.
    void validate() const;
};

} // namespace shockmcp

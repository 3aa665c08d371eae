#pragma once
#include "shockmcp/client/downstream.hpp"

#include <string>

namespace shockmcp::client
{

/// DownstreamClient backed by cpp-httplib.
///
/// Every request carries the `OpenShockToken` header. A fresh httplib::Client is used per
/// call so concurrent tool calls never share a socket.
class OpenShockClient : public DownstreamClient
{
  public:
    static constexpr const char* CONTROL_PATH = "/2/shockers/control";

    /**
     * @param base_url e.g. "https://api.openshock.app"; a path prefix is kept
     * @param api_token value for the OpenShockToken header
     * @param timeout_seconds connection and read timeout
     */
    OpenShockClient(std::string base_url, std::string api_token, int timeout_seconds = 30);

    DownstreamResult send(const std::vector<DownstreamCommand>& commands,
                          const std::string& label) override;

  private:
    std::string base_url_;
    std::string api_token_;
    int timeout_seconds_;
    std::string origin_;      // scheme://host:port
    std::string path_prefix_; // "" or "/prefix"
};

} // namespace shockmcp::client

#pragma once
#include "shockmcp/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace shockmcp::client
{

/// 2xx from the control endpoint; `body` is the parsed response document.
struct DownstreamOk
{
    Json body;
};

/// Non-2xx status, or status 0 when no response arrived (body then holds the transport error).
struct DownstreamFail
{
    int status{0};
    std::string body;
};

using DownstreamResult = std::variant<DownstreamOk, DownstreamFail>;

/// Seam between the dispatcher and the OpenShock control API.
///
/// One blocking round trip per call. Implementations never throw for HTTP-level
/// failures; they report them as DownstreamFail.
class DownstreamClient
{
  public:
    virtual ~DownstreamClient() = default;

    /// @param label shown by OpenShock as the command source ("MCP-<TOOL>")
    virtual DownstreamResult send(const std::vector<DownstreamCommand>& commands,
                                  const std::string& label) = 0;
};

/// Request body for POST /2/shockers/control.
Json make_control_body(const std::vector<DownstreamCommand>& commands, const std::string& label);

} // namespace shockmcp::client

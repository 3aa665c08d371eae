#include "shockmcp/client/downstream.hpp"

namespace shockmcp::client
{

Json make_control_body(const std::vector<DownstreamCommand>& commands, const std::string& label)
{
    Json shocks = Json::array();
    for (const auto& c : commands)
        shocks.push_back(c);
    return Json{{"shocks", shocks}, {"customName", label}};
}

} // namespace shockmcp::client

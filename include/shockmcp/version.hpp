#pragma once

namespace shockmcp
{

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

} // namespace shockmcp

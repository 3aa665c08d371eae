#pragma once
#include <stdexcept>
#include <string>

namespace shockmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Raised at startup when required settings are missing or out of range.
struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace shockmcp

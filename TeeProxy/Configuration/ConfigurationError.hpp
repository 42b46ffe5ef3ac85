#pragma once
#include <precompiled.hpp>

namespace TeeProxy::Configuration
{
    class ConfigurationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}

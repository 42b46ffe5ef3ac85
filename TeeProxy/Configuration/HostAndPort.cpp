#include <precompiled.hpp>
#include "HostAndPort.hpp"
#include <Configuration/ConfigurationError.hpp>

namespace TeeProxy::Configuration
{
    HostAndPort HostAndPort::parse(std::string_view const text)
    {
        auto const fail = [text](std::string_view const reason)
        {
            return ConfigurationError{ "invalid address \"" + std::string{ text } + "\": " + std::string{ reason } };
        };

        auto const separator = text.rfind(':');
        if (separator == std::string_view::npos)
        {
            throw fail("missing port");
        }

        auto host = text.substr(0, separator);
        auto const port = text.substr(separator + 1);

        if (!host.empty() && host.front() == '[')
        {
            if (host.back() != ']')
            {
                throw fail("unterminated IPv6 literal");
            }
            host = host.substr(1, host.size() - 2);
        }
        else if (host.find(':') != std::string_view::npos)
        {
            throw fail("IPv6 hosts must be written as [address]:port");
        }

        if (port.empty() || port.size() > 5)
        {
            throw fail("port must be a number between 0 and 65535");
        }

        auto value = std::uint32_t{ 0 };
        for (auto const c : port)
        {
            if (c < '0' || c > '9')
            {
                throw fail("port must be a number between 0 and 65535");
            }
            value = value * 10 + static_cast<std::uint32_t>(c - '0');
        }
        if (value > 65535)
        {
            throw fail("port must be a number between 0 and 65535");
        }

        return HostAndPort{ std::string{ host }, static_cast<std::uint16_t>(value) };
    }

    std::string HostAndPort::getService() const
    {
        return std::to_string(port);
    }

    std::string HostAndPort::toString() const
    {
        if (host.find(':') != std::string::npos)
        {
            return "[" + host + "]:" + getService();
        }
        return host + ":" + getService();
    }

    std::ostream& operator<<(std::ostream& stream, HostAndPort const& address)
    {
        return stream << address.toString();
    }
}

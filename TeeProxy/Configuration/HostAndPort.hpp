#pragma once
#include <precompiled.hpp>

namespace TeeProxy::Configuration
{
    // A "host:port" pair as given on the command line. The host may be empty
    // (listen on every interface) or a bracketed IPv6 literal.
    struct HostAndPort
    {
        std::string host;
        std::uint16_t port = 0;

        static HostAndPort parse(std::string_view text);

        std::string getService() const;

        std::string toString() const;

        friend bool operator==(HostAndPort const& left, HostAndPort const& right) noexcept
        {
            return left.host == right.host && left.port == right.port;
        }

        friend bool operator!=(HostAndPort const& left, HostAndPort const& right) noexcept
        {
            return !(left == right);
        }
    };

    std::ostream& operator<<(std::ostream& stream, HostAndPort const& address);
}

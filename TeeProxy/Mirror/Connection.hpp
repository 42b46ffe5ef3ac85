#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Configuration/Configuration.hpp>
#include <Mirror/Connector.hpp>
#include <Mirror/SocketStream.hpp>

namespace TeeProxy::Mirror
{
    // One accepted client: connects upstream, then pumps until done.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        using Strand = IOManager::StrandType;
        using ErrorCode = boost::system::error_code;
        using Socket = SocketStream::Socket;
        using Configuration = ::TeeProxy::Configuration::Configuration;
        using SteadyClock = std::chrono::steady_clock;
        using TimePoint = SteadyClock::time_point;
    private:
        struct PrivateConstructor {};

    public:
        static constexpr auto description = "Connection";
    private:
        Strand m_strand;
        std::shared_ptr<SocketStream> m_client;
        std::shared_ptr<Connector const> m_connector;
        std::shared_ptr<Configuration const> m_configuration;
        TimePoint m_started;
        TimePoint m_connected;

    public:
        // `acceptedSocket` must use the inner executor of `strand`.
        static std::shared_ptr<Connection> create
        (
            Strand const& strand,
            Socket::Type acceptedSocket,
            std::shared_ptr<Connector const> connector,
            std::shared_ptr<Configuration const> configuration
        );

        Connection
        (
            PrivateConstructor,
            Strand const& strand,
            Socket::Type&& acceptedSocket,
            std::shared_ptr<Connector const>&& connector,
            std::shared_ptr<Configuration const>&& configuration
        );

    private:
        void start();

        void onConnected(ErrorCode const& code, std::shared_ptr<Stream> upstream);

        void onFinished(bool timedOut);
    };
}

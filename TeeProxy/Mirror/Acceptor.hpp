#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Configuration/Configuration.hpp>
#include <Mirror/Connector.hpp>
#include <Utility/WithStrand.hpp>

namespace TeeProxy::Mirror 
{
    class Acceptor : public std::enable_shared_from_this<Acceptor> 
    {
    public:
        using Strand = IOManager::StrandType;
        using ErrorCode = boost::system::error_code;
        using EndPoint = boost::asio::ip::tcp::endpoint;
        using Listener = Utility::WithStrand<boost::asio::ip::tcp::acceptor>;
        using Socket = Utility::WithStrand<boost::asio::ip::tcp::socket>;
        using Timer = Utility::WithStrand<boost::asio::steady_timer>;
        using Configuration = ::TeeProxy::Configuration::Configuration;
    private:
        struct PrivateConstructor {};

        struct AcceptLoop
        {
            Timer backoffTimer;
            std::chrono::milliseconds backoff;
        };

    public:
        static constexpr auto description = "Acceptor";
        static constexpr auto initialBackoff = std::chrono::milliseconds{ 5 };
        static constexpr auto maxBackoff = std::chrono::milliseconds{ 1000 };
    private:
        IOManager::ObjectMaker m_objectMaker;
        Strand m_strand;
        Listener m_listener;
        EndPoint m_localEndPoint;
        std::vector<AcceptLoop> m_loops;
        std::shared_ptr<Connector const> m_connector;
        std::shared_ptr<Configuration const> m_configuration;
        bool m_stopped;

    public:
        // Binds the listen address; throws boost::system::system_error on failure.
        static std::shared_ptr<Acceptor> create
        (
            IOManager::ObjectMaker const& objectMaker,
            std::shared_ptr<Configuration const> configuration,
            std::shared_ptr<Connector const> connector
        );

        Acceptor
        (
            PrivateConstructor,
            IOManager::ObjectMaker const& objectMaker,
            EndPoint const& listenEndPoint,
            std::shared_ptr<Configuration const>&& configuration,
            std::shared_ptr<Connector const>&& connector
        );

        EndPoint const& getLocalEndPoint() const noexcept;

        // Closes the listening socket. Connections already accepted carry on.
        void stop();

    private:
        // Opens, binds and listens; throws boost::system::system_error on failure.
        void listen(EndPoint endPoint);

        void prepareForNextConnection(std::size_t loop);

        void backOff(std::size_t loop);
    };
}

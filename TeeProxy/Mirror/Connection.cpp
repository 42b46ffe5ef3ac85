#include "Connection.hpp"
#include <precompiled.hpp>
#include <Logging/Logging.hpp>
#include <Mirror/ConnectionHandler.hpp>

using LogLevel = TeeProxy::Logging::Level;

using TeeProxy::Configuration::formatDuration;

namespace TeeProxy::Mirror
{
    template<typename... Arguments>
    void logLine(LogLevel level, Arguments&&... arguments)
    {
        return Logging::logLine<Connection>(level, std::forward<Arguments>(arguments)...);
    }

    std::shared_ptr<Connection> Connection::create
    (
        Strand const& strand,
        Socket::Type acceptedSocket,
        std::shared_ptr<Connector const> connector,
        std::shared_ptr<Configuration const> configuration
    )
    {
        auto const self = std::make_shared<Connection>
        (
            PrivateConstructor{},
            strand,
            std::move(acceptedSocket),
            std::move(connector),
            std::move(configuration)
        );

        boost::asio::defer(self->m_strand, [self] { self->start(); });

        return self;
    }

    Connection::Connection
    (
        PrivateConstructor,
        Strand const& strand,
        Socket::Type&& acceptedSocket,
        std::shared_ptr<Connector const>&& connector,
        std::shared_ptr<Configuration const>&& configuration
    ) :
        m_strand{ strand },
        m_client{ SocketStream::create(m_strand, std::move(acceptedSocket)) },
        m_connector{ std::move(connector) },
        m_configuration{ std::move(configuration) },
        m_started{ SteadyClock::now() },
        m_connected{ m_started }
    {}

    void Connection::start()
    {
        logLine(LogLevel::debug, "New connection from ", m_client->getRemoteEndPoint());
        m_started = SteadyClock::now();

        m_connector->asyncConnect
        (
            m_strand,
            [self = shared_from_this()](ErrorCode const& code, std::shared_ptr<Stream> upstream)
            {
                self->onConnected(code, std::move(upstream));
            }
        );
    }

    void Connection::onConnected(ErrorCode const& code, std::shared_ptr<Stream> upstream)
    {
        m_connected = SteadyClock::now();
        logLine(LogLevel::debug, "connect time ", formatDuration(m_connected - m_started));

        if (code.failed() || !upstream)
        {
            logLine(LogLevel::error, "Couldn't establish connection to upstream! ", code.message());
            auto const closeCode = m_client->close();
            if (closeCode.failed())
            {
                logLine(LogLevel::debug, "Closing client failed: ", closeCode.message());
            }
            return;
        }

        ConnectionHandler::handle
        (
            m_strand,
            m_client,
            std::move(upstream),
            m_configuration->timeout,
            [self = shared_from_this()](bool const timedOut)
            {
                self->onFinished(timedOut);
            }
        );
    }

    void Connection::onFinished(bool const timedOut)
    {
        auto const finished = SteadyClock::now();
        auto const total = finished - m_started;
        if (total > m_configuration->logThreshold)
        {
            logLine
            (
                LogLevel::info,
                "total: ", formatDuration(total),
                ", conn: ", formatDuration(m_connected - m_started),
                ", read: ", formatDuration(finished - m_connected),
                timedOut ? " (timed out)" : ""
            );
        }
    }
}

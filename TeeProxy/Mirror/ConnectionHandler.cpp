#include "ConnectionHandler.hpp"
#include <precompiled.hpp>
#include <Logging/Logging.hpp>

using LogLevel = TeeProxy::Logging::Level;

namespace TeeProxy::Mirror
{
    template<typename... Arguments>
    void logLine(LogLevel level, Arguments&&... arguments)
    {
        return Logging::logLine<ConnectionHandler>(level, std::forward<Arguments>(arguments)...);
    }

    namespace
    {
        constexpr auto clientToUpstream = std::size_t{ 0 };
        constexpr auto upstreamToClient = std::size_t{ 1 };
    }

    void ConnectionHandler::handle
    (
        Strand const& strand,
        std::shared_ptr<Stream> client,
        std::shared_ptr<Stream> upstream,
        std::chrono::nanoseconds const timeout,
        Handler handler
    )
    {
        if (!client || !upstream)
        {
            throw std::invalid_argument{ "ConnectionHandler: both streams are required" };
        }

        auto const self = std::make_shared<ConnectionHandler>
        (
            PrivateConstructor{},
            strand,
            std::move(client),
            std::move(upstream),
            std::move(handler)
        );
        self->start(timeout);
    }

    ConnectionHandler::ConnectionHandler
    (
        PrivateConstructor,
        Strand const& strand,
        std::shared_ptr<Stream>&& client,
        std::shared_ptr<Stream>&& upstream,
        Handler&& handler
    ) :
        m_strand{ strand },
        m_timer{ m_strand },
        m_pumps
        {
            Pump{ "client", client, upstream, Buffer(bufferSize), false },
            Pump{ "server", upstream, client, Buffer(bufferSize), false }
        },
        m_handler{ std::move(handler) },
        m_finished{ false }
    {}

    void ConnectionHandler::start(std::chrono::nanoseconds const timeout)
    {
        logLine(LogLevel::debug, "proxying the bytes");

        m_timer.asyncWait(timeout, [self = shared_from_this()](ErrorCode const& code)
        {
            self->onTimeout(code);
        });

        readFrom(clientToUpstream);
        readFrom(upstreamToClient);
    }

    void ConnectionHandler::readFrom(std::size_t const index)
    {
        auto& pump = m_pumps.at(index);
        pump.source->asyncReadSome
        (
            boost::asio::buffer(pump.buffer),
            [self = shared_from_this(), index](ErrorCode const& code, std::size_t const bytesRead)
            {
                self->onRead(index, code, bytesRead);
            }
        );
    }

    void ConnectionHandler::onRead(std::size_t const index, ErrorCode const& code, std::size_t const bytesRead)
    {
        if (code.failed())
        {
            return stopPump(index, code);
        }

        auto& pump = m_pumps.at(index);
        pump.destination->asyncWrite
        (
            boost::asio::buffer(pump.buffer.data(), bytesRead),
            [self = shared_from_this(), index](ErrorCode const& code, std::size_t)
            {
                self->onWritten(index, code);
            }
        );
    }

    void ConnectionHandler::onWritten(std::size_t const index, ErrorCode const& code)
    {
        if (code.failed())
        {
            return stopPump(index, code);
        }

        readFrom(index);
    }

    void ConnectionHandler::stopPump(std::size_t const index, ErrorCode const& code)
    {
        auto& pump = m_pumps.at(index);
        if (pump.finished)
        {
            return;
        }
        pump.finished = true;

        // One direction ending tears down the other one as well.
        closeBoth();
        logLine(LogLevel::debug, pump.name, " disconnected: ", code.message());

        auto const allFinished = std::all_of(m_pumps.begin(), m_pumps.end(), [](Pump const& pump)
        {
            return pump.finished;
        });
        if (allFinished)
        {
            finish(false);
        }
    }

    void ConnectionHandler::onTimeout(ErrorCode const& code)
    {
        if (code == boost::asio::error::operation_aborted || m_finished)
        {
            return;
        }

        if (code.failed())
        {
            logLine(LogLevel::error, "Timeout wait failed: ", code.message());
        }

        logLine(LogLevel::error, "Connection timeout!");
        finish(true);
    }

    void ConnectionHandler::closeBoth()
    {
        for (auto const& stream : { m_pumps[clientToUpstream].source, m_pumps[upstreamToClient].source })
        {
            auto const code = stream->close();
            if (code.failed())
            {
                logLine(LogLevel::debug, "Close failed: ", code.message());
            }
        }
    }

    void ConnectionHandler::finish(bool const timedOut)
    {
        if (m_finished)
        {
            return;
        }
        m_finished = true;
        m_timer->cancel();

        closeBoth();

        auto handler = std::move(m_handler);
        if (handler)
        {
            handler(timedOut);
        }
    }
}

#include "Connector.hpp"
#include <precompiled.hpp>
#include <Logging/Logging.hpp>
#include <Mirror/SocketStream.hpp>

using LogLevel = TeeProxy::Logging::Level;
using SteadyClock = std::chrono::steady_clock;

using TeeProxy::Configuration::formatDuration;

namespace TeeProxy::Mirror
{
    template<typename... Arguments>
    void logLine(LogLevel level, Arguments&&... arguments)
    {
        return Logging::logLine<Connector>(level, std::forward<Arguments>(arguments)...);
    }

    std::shared_ptr<Connector> Connector::create
    (
        std::shared_ptr<Configuration const> configuration,
        std::shared_ptr<Tee::Pool> pool
    )
    {
        if (!configuration || !pool)
        {
            throw std::invalid_argument{ "Connector: configuration and pool are required" };
        }

        return std::make_shared<Connector>
        (
            PrivateConstructor{},
            std::move(configuration),
            std::move(pool)
        );
    }

    Connector::Connector
    (
        PrivateConstructor,
        std::shared_ptr<Configuration const>&& configuration,
        std::shared_ptr<Tee::Pool>&& pool
    ) :
        m_configuration{ std::move(configuration) },
        m_pool{ std::move(pool) }
    {}

    void Connector::asyncConnect(Strand const& strand, Handler handler) const
    {
        auto const start = SteadyClock::now();
        auto onProductionConnected = [self = shared_from_this(), strand, handler = std::move(handler), start]
        (ErrorCode const& code, Dialer::Socket::Type socket) mutable
        {
            logLine(LogLevel::debug, "connect to a ", formatDuration(SteadyClock::now() - start));
            if (code.failed())
            {
                logLine
                (
                    LogLevel::error,
                    "Could not connect to 'a' (", self->m_configuration->production, "), closing: ", code.message()
                );
                return handler(code, nullptr);
            }

            auto production = SocketStream::create(strand, std::move(socket));
            if (!self->m_configuration->shadow.has_value())
            {
                return handler(ErrorCode{}, std::move(production));
            }

            self->connectShadow(strand, std::move(production), std::move(handler));
        };

        Dialer::asyncDial
        (
            strand,
            m_configuration->production,
            m_configuration->productionDeadline,
            std::move(onProductionConnected)
        );
    }

    void Connector::connectShadow
    (
        Strand const& strand,
        std::shared_ptr<Stream> production,
        Handler handler
    ) const
    {
        auto const start = SteadyClock::now();
        auto onShadowConnected = 
        [self = shared_from_this(), strand, production = std::move(production), handler = std::move(handler), start]
        (ErrorCode const& code, Dialer::Socket::Type socket) mutable
        {
            logLine(LogLevel::debug, "connect to b ", formatDuration(SteadyClock::now() - start));
            if (code.failed())
            {
                // B is optional, carry on with A alone.
                logLine
                (
                    LogLevel::error,
                    "Could not connect to 'b' (", self->m_configuration->shadow.value(), "), ignoring: ", code.message()
                );
                return handler(ErrorCode{}, std::move(production));
            }

            auto const& configuration = *self->m_configuration;
            auto options = Tee::Options{};
            options.linger = configuration.linger;
            options.shadowBacklogLimit = configuration.shadowBacklogLimit;

            auto tee = Tee::create
            (
                *self->m_pool,
                strand,
                std::move(production),
                SocketStream::create(strand, std::move(socket)),
                options
            );
            handler(ErrorCode{}, std::move(tee));
        };

        Dialer::asyncDial
        (
            strand,
            m_configuration->shadow.value(),
            m_configuration->shadowDeadline,
            std::move(onShadowConnected)
        );
    }
}

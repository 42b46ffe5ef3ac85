#include "Acceptor.hpp"
#include <precompiled.hpp>
#include <Logging/Logging.hpp>
#include <Mirror/Connection.hpp>
#include <Utility/WeakRefHandler.hpp>

using TCP = boost::asio::ip::tcp;
using LogLevel = TeeProxy::Logging::Level;

using TeeProxy::Utility::makeWeakHandler;

namespace TeeProxy::Mirror
{
    template<typename... Arguments>
    void logLine(LogLevel level, Arguments&&... arguments)
    {
        return Logging::logLine<Acceptor>(level, std::forward<Arguments>(arguments)...);
    }

    namespace
    {
        TCP::endpoint resolveListenEndPoint
        (
            IOManager::ObjectMaker const& objectMaker,
            TeeProxy::Configuration::HostAndPort const& address
        )
        {
            // Every interface, both address families where the host has IPv6.
            if (address.host.empty())
            {
                return TCP::endpoint{ TCP::v6(), address.port };
            }

            auto resolver = objectMaker.make<TCP::resolver>();
            auto const results = resolver.resolve
            (
                address.host,
                address.getService(),
                TCP::resolver::passive | TCP::resolver::numeric_service
            );
            if (results.empty())
            {
                throw boost::system::system_error{ boost::asio::error::host_not_found, "resolve " + address.toString() };
            }
            return results.begin()->endpoint();
        }
    }

    std::shared_ptr<Acceptor> Acceptor::create
    (
        IOManager::ObjectMaker const& objectMaker,
        std::shared_ptr<Configuration const> configuration,
        std::shared_ptr<Connector const> connector
    )
    {
        if (!configuration || !connector)
        {
            throw std::invalid_argument{ "Acceptor: configuration and connector are required" };
        }

        auto const listenEndPoint = resolveListenEndPoint(objectMaker, configuration->listen);
        auto const self = std::make_shared<Acceptor>
        (
            PrivateConstructor{},
            objectMaker,
            listenEndPoint,
            std::move(configuration),
            std::move(connector)
        );

        auto const action = [](Acceptor& self)
        {
            logLine(LogLevel::info, "Listening on ", self.m_localEndPoint, " with ", self.m_loops.size(), " accept loops");
            for (auto loop = std::size_t{ 0 }; loop < self.m_loops.size(); ++loop)
            {
                self.prepareForNextConnection(loop);
            }
        };
        boost::asio::defer(self->m_strand, makeWeakHandler(self, action));

        return self;
    }

    Acceptor::Acceptor
    (
        PrivateConstructor,
        IOManager::ObjectMaker const& objectMaker,
        EndPoint const& listenEndPoint,
        std::shared_ptr<Configuration const>&& configuration,
        std::shared_ptr<Connector const>&& connector
    ) :
        m_objectMaker{ objectMaker },
        m_strand{ objectMaker.makeStrand() },
        m_listener{ m_strand },
        m_connector{ std::move(connector) },
        m_configuration{ std::move(configuration) },
        m_stopped{ false }
    {
        listen(listenEndPoint);
        m_localEndPoint = m_listener->local_endpoint();

        m_loops.reserve(m_configuration->threads);
        for (auto i = std::size_t{ 0 }; i < m_configuration->threads; ++i)
        {
            m_loops.push_back(AcceptLoop{ Timer{ m_strand }, std::chrono::milliseconds::zero() });
        }
    }

    void Acceptor::listen(EndPoint endPoint)
    {
        auto const wildcard = endPoint.address().is_unspecified();

        auto code = ErrorCode{};
        m_listener->open(endPoint.protocol(), code);
        if (code == boost::asio::error::address_family_not_supported && wildcard && endPoint.address().is_v6())
        {
            logLine(LogLevel::info, "IPv6 unavailable, listening on IPv4 only");
            endPoint = EndPoint{ TCP::v4(), endPoint.port() };
            code = ErrorCode{};
            m_listener->open(endPoint.protocol(), code);
        }
        if (code.failed())
        {
            throw boost::system::system_error{ code, "open listener" };
        }

        m_listener->set_option(TCP::acceptor::reuse_address{ true });
        if (wildcard && endPoint.address().is_v6())
        {
            m_listener->set_option(boost::asio::ip::v6_only{ false });
        }
        m_listener->bind(endPoint);
        m_listener->listen();
    }

    Acceptor::EndPoint const& Acceptor::getLocalEndPoint() const noexcept
    {
        return m_localEndPoint;
    }

    void Acceptor::stop()
    {
        auto const action = [](Acceptor& self)
        {
            if (self.m_stopped)
            {
                return;
            }
            self.m_stopped = true;
            logLine(LogLevel::info, "Stopping, no longer accepting connections");

            auto code = ErrorCode{};
            self.m_listener->close(code);
            if (code.failed())
            {
                logLine(LogLevel::error, "Closing listener failed: ", code.message());
            }
            for (auto& loop : self.m_loops)
            {
                loop.backoffTimer->cancel();
            }
        };
        boost::asio::dispatch(m_strand, makeWeakHandler(this, action));
    }

    void Acceptor::prepareForNextConnection(std::size_t const loop)
    {
        if (m_stopped)
        {
            return;
        }

        auto const connectionStrand = m_objectMaker.makeStrand();
        auto const handler = [loop, connectionStrand](Acceptor& self, ErrorCode const& code, Socket::Type socket)
        {
            if (self.m_stopped)
            {
                return;
            }

            if (code.failed())
            {
                logLine(LogLevel::error, "Accept failed: ", code.message());
                return self.backOff(loop);
            }

            self.m_loops.at(loop).backoff = std::chrono::milliseconds::zero();
            self.prepareForNextConnection(loop);

            Connection::create
            (
                connectionStrand,
                std::move(socket),
                self.m_connector,
                self.m_configuration
            );
        };

        auto const socketExecutor = boost::asio::any_io_executor{ connectionStrand.get_inner_executor() };
        m_listener.asyncAccept(socketExecutor, makeWeakHandler(this, handler));
    }

    void Acceptor::backOff(std::size_t const loop)
    {
        auto& acceptLoop = m_loops.at(loop);
        acceptLoop.backoff = acceptLoop.backoff == std::chrono::milliseconds::zero()
            ? initialBackoff
            : std::min(acceptLoop.backoff * 2, maxBackoff);

        auto const onWaited = [loop](Acceptor& self, ErrorCode const& code)
        {
            if (code == boost::asio::error::operation_aborted)
            {
                return;
            }
            self.prepareForNextConnection(loop);
        };
        acceptLoop.backoffTimer.asyncWait(acceptLoop.backoff, makeWeakHandler(this, onWaited));
    }
}

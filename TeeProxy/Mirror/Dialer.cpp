#include "Dialer.hpp"
#include <precompiled.hpp>
#include <Logging/Logging.hpp>

using TCP = boost::asio::ip::tcp;
using LogLevel = TeeProxy::Logging::Level;

namespace TeeProxy::Mirror
{
    template<typename... Arguments>
    void logLine(LogLevel level, Arguments&&... arguments)
    {
        return Logging::logLine<Dialer>(level, std::forward<Arguments>(arguments)...);
    }

    void Dialer::asyncDial
    (
        Strand const& strand,
        Address const& address,
        std::chrono::nanoseconds const deadline,
        Handler handler
    )
    {
        auto const self = std::make_shared<Dialer>
        (
            PrivateConstructor{},
            strand,
            address,
            std::move(handler)
        );

        boost::asio::dispatch(strand, [self, deadline] { self->start(deadline); });
    }

    Dialer::Dialer
    (
        PrivateConstructor,
        Strand const& strand,
        Address const& address,
        Handler&& handler
    ) :
        m_strand{ strand },
        m_address{ address },
        m_resolver{ m_strand },
        m_socket{ m_strand },
        m_deadline{ m_strand },
        m_handler{ std::move(handler) },
        m_completed{ false }
    {}

    void Dialer::start(std::chrono::nanoseconds const deadline)
    {
        m_deadline.asyncWait(deadline, [self = shared_from_this()](ErrorCode const& code)
        {
            self->onDeadline(code);
        });

        m_resolver.asyncResolve
        (
            m_address.host,
            m_address.getService(),
            [self = shared_from_this()](ErrorCode const& code, TCP::resolver::results_type const& endPoints)
            {
                self->onResolved(code, endPoints);
            }
        );
    }

    void Dialer::onResolved(ErrorCode const& code, TCP::resolver::results_type const& endPoints)
    {
        if (m_completed)
        {
            return;
        }

        if (code.failed())
        {
            return complete(code);
        }

        m_socket.asyncConnect
        (
            endPoints,
            [self = shared_from_this()](ErrorCode const& code, TCP::endpoint const&)
            {
                self->complete(code);
            }
        );
    }

    void Dialer::onDeadline(ErrorCode const& code)
    {
        if (code == boost::asio::error::operation_aborted || m_completed)
        {
            return;
        }

        if (code.failed())
        {
            logLine(LogLevel::error, "Deadline wait failed: ", code.message());
        }

        m_resolver->cancel();
        auto closeCode = ErrorCode{};
        m_socket->close(closeCode);
        if (closeCode.failed())
        {
            logLine(LogLevel::debug, "Closing abandoned socket to ", m_address, " failed: ", closeCode.message());
        }

        complete(boost::asio::error::timed_out);
    }

    void Dialer::complete(ErrorCode const& code)
    {
        if (m_completed)
        {
            return;
        }
        m_completed = true;
        m_deadline->cancel();

        auto handler = std::move(m_handler);
        if (code.failed())
        {
            return handler(code, Socket::Type{ m_strand.get_inner_executor() });
        }
        handler(code, std::move(m_socket.get()));
    }
}

#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Configuration/HostAndPort.hpp>
#include <Utility/WithStrand.hpp>

namespace TeeProxy::Mirror
{
    // Resolves and connects to a backend within a deadline. The deadline covers
    // both steps; when it expires the attempt is abandoned and the handler gets
    // boost::asio::error::timed_out.
    class Dialer : public std::enable_shared_from_this<Dialer>
    {
    public:
        using Strand = IOManager::StrandType;
        using ErrorCode = boost::system::error_code;
        using Socket = Utility::WithStrand<boost::asio::ip::tcp::socket>;
        using Resolver = Utility::WithStrand<boost::asio::ip::tcp::resolver>;
        using Timer = Utility::WithStrand<boost::asio::steady_timer>;
        using Address = Configuration::HostAndPort;
        using Handler = std::function<void(ErrorCode const&, Socket::Type)>;
    private:
        struct PrivateConstructor {};

    public:
        static constexpr auto description = "Dialer";
    private:
        Strand m_strand;
        Address m_address;
        Resolver m_resolver;
        Socket m_socket;
        Timer m_deadline;
        Handler m_handler;
        bool m_completed;

    public:
        // `handler` runs exactly once, on `strand`.
        static void asyncDial
        (
            Strand const& strand,
            Address const& address,
            std::chrono::nanoseconds deadline,
            Handler handler
        );

        Dialer
        (
            PrivateConstructor,
            Strand const& strand,
            Address const& address,
            Handler&& handler
        );

    private:
        void start(std::chrono::nanoseconds deadline);

        void onResolved(ErrorCode const& code, boost::asio::ip::tcp::resolver::results_type const& endPoints);

        void onDeadline(ErrorCode const& code);

        void complete(ErrorCode const& code);
    };
}

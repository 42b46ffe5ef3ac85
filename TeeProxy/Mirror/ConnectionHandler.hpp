#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Mirror/Stream.hpp>
#include <Utility/WithStrand.hpp>

namespace TeeProxy::Mirror
{
    // Copies bytes in both directions between a client and its upstream until
    // either side ends, or until the timeout expires. Both streams are closed
    // before the completion handler runs.
    class ConnectionHandler : public std::enable_shared_from_this<ConnectionHandler>
    {
    public:
        using Strand = IOManager::StrandType;
        using ErrorCode = boost::system::error_code;
        using Timer = Utility::WithStrand<boost::asio::steady_timer>;
        using Buffer = std::vector<std::byte>;
        using Handler = std::function<void(bool timedOut)>;
    private:
        struct PrivateConstructor {};

        struct Pump
        {
            std::string_view name;
            std::shared_ptr<Stream> source;
            std::shared_ptr<Stream> destination;
            Buffer buffer;
            bool finished;
        };

    public:
        static constexpr auto description = "ConnectionHandler";
        static constexpr auto bufferSize = std::size_t{ 32 * 1024 };
    private:
        Strand m_strand;
        Timer m_timer;
        std::array<Pump, 2> m_pumps;
        Handler m_handler;
        bool m_finished;

    public:
        // Must be called on `strand`.
        static void handle
        (
            Strand const& strand,
            std::shared_ptr<Stream> client,
            std::shared_ptr<Stream> upstream,
            std::chrono::nanoseconds timeout,
            Handler handler
        );

        ConnectionHandler
        (
            PrivateConstructor,
            Strand const& strand,
            std::shared_ptr<Stream>&& client,
            std::shared_ptr<Stream>&& upstream,
            Handler&& handler
        );

    private:
        void start(std::chrono::nanoseconds timeout);

        void readFrom(std::size_t index);

        void onRead(std::size_t index, ErrorCode const& code, std::size_t bytesRead);

        void onWritten(std::size_t index, ErrorCode const& code);

        void stopPump(std::size_t index, ErrorCode const& code);

        void onTimeout(ErrorCode const& code);

        void closeBoth();

        void finish(bool timedOut);
    };
}

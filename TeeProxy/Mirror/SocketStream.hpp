#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Mirror/Stream.hpp>
#include <Utility/WithStrand.hpp>

namespace TeeProxy::Mirror
{
    class SocketStream final : public Stream, public std::enable_shared_from_this<SocketStream>
    {
    public:
        using Strand = IOManager::StrandType;
        using EndPoint = boost::asio::ip::tcp::endpoint;
        using Socket = Utility::WithStrand<boost::asio::ip::tcp::socket>;
    private:
        struct PrivateConstructor {};

    public:
        static constexpr auto description = "SocketStream";
    private:
        Socket m_socket;

    public:
        static std::shared_ptr<SocketStream> create
        (
            Strand const& strand,
            Socket::Type socket
        );

        SocketStream
        (
            PrivateConstructor,
            Strand const& strand,
            Socket::Type&& socket
        );

        void asyncReadSome(MutableBuffer buffer, ReadHandler handler) override;

        void asyncWrite(ConstBuffer buffer, WriteHandler handler) override;

        ErrorCode close() override;

        // Empty endpoint when the peer is already gone.
        EndPoint getRemoteEndPoint() const;
    };
}

#include "SocketStream.hpp"
#include <precompiled.hpp>

namespace TeeProxy::Mirror
{
    std::shared_ptr<SocketStream> SocketStream::create
    (
        Strand const& strand,
        Socket::Type socket
    )
    {
        return std::make_shared<SocketStream>
        (
            PrivateConstructor{},
            strand,
            std::move(socket)
        );
    }

    SocketStream::SocketStream
    (
        PrivateConstructor,
        Strand const& strand,
        Socket::Type&& socket
    ) :
        m_socket{ strand, Utility::Adopt{}, std::move(socket) }
    {}

    void SocketStream::asyncReadSome(MutableBuffer const buffer, ReadHandler handler)
    {
        m_socket.asyncReadSome
        (
            buffer,
            [self = shared_from_this(), handler = std::move(handler)]
            (ErrorCode const& code, std::size_t const bytesRead)
            {
                handler(code, bytesRead);
            }
        );
    }

    void SocketStream::asyncWrite(ConstBuffer const buffer, WriteHandler handler)
    {
        m_socket.asyncWrite
        (
            buffer,
            [self = shared_from_this(), handler = std::move(handler)]
            (ErrorCode const& code, std::size_t const bytesWritten)
            {
                handler(code, bytesWritten);
            }
        );
    }

    SocketStream::ErrorCode SocketStream::close()
    {
        auto code = ErrorCode{};
        if (!m_socket->is_open())
        {
            return code;
        }
        m_socket->close(code);
        return code;
    }

    SocketStream::EndPoint SocketStream::getRemoteEndPoint() const
    {
        auto code = ErrorCode{};
        auto endPoint = m_socket->remote_endpoint(code);
        if (code.failed())
        {
            return EndPoint{};
        }
        return endPoint;
    }
}

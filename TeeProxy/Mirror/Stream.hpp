#pragma once
#include <precompiled.hpp>

namespace TeeProxy::Mirror
{
    // Asynchronous duplex byte stream.
    //
    // Implementations are bound to a strand; every member function must be
    // called from that strand, and completion handlers run on it.
    class Stream
    {
    public:
        using ErrorCode = boost::system::error_code;
        using MutableBuffer = boost::asio::mutable_buffer;
        using ConstBuffer = boost::asio::const_buffer;
        using ReadHandler = std::function<void(ErrorCode const&, std::size_t)>;
        using WriteHandler = std::function<void(ErrorCode const&, std::size_t)>;

        virtual ~Stream() = default;

        // Reads at least one byte, or fails (boost::asio::error::eof at end of stream).
        virtual void asyncReadSome(MutableBuffer buffer, ReadHandler handler) = 0;

        // Writes the whole buffer, or fails.
        virtual void asyncWrite(ConstBuffer buffer, WriteHandler handler) = 0;

        // Idempotent. Pending operations complete with boost::asio::error::operation_aborted.
        virtual ErrorCode close() = 0;
    };
}

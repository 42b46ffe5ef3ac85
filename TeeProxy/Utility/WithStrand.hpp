#pragma once
#include "precompiled.hpp"
#include <IOManager.hpp>

namespace TeeProxy::Utility {
    // Tag for wrapping an already constructed I/O object.
    struct Adopt {};

    namespace Details
    {
        template<typename T>
        class WithStrandBase
        {
        public:
            using Type = T;

            template<typename... Args>
            WithStrandBase(IOManager::StrandType const& strand, Args&&... args) :
                m_strand{ strand },
                m_object{ m_strand.get_inner_executor(), std::forward<Args>(args)... }
            {}

            WithStrandBase(IOManager::StrandType const& strand, Adopt, T&& object) :
                m_strand{ strand },
                m_object{ std::move(object) }
            {}

            T* operator->() noexcept { return &m_object; }

            T const* operator->() const noexcept { return &m_object; }

            T& get() noexcept { return m_object; }

        protected:
            IOManager::StrandType m_strand;
            T m_object;
        };
    }

    template<typename T>
    class WithStrand : public Details::WithStrandBase<T>
    {
    public:
        using Details::WithStrandBase<T>::WithStrandBase;
    };

    template<>
    class WithStrand<boost::asio::ip::tcp::socket> :
        public Details::WithStrandBase<boost::asio::ip::tcp::socket>
    {
    public:
        using Details::WithStrandBase<boost::asio::ip::tcp::socket>::WithStrandBase;

        template<typename MutableBufferSequence, typename ReadHandler>
        auto asyncReadSome(MutableBufferSequence const& buffers, ReadHandler&& handler)
        {
            return m_object.async_read_some
            (
                buffers,
                boost::asio::bind_executor(m_strand, std::forward<ReadHandler>(handler))
            );
        }

        template<typename ConstBufferSequence, typename WriteHandler>
        auto asyncWrite(ConstBufferSequence const& buffers, WriteHandler&& handler)
        {
            return boost::asio::async_write
            (
                m_object,
                buffers,
                boost::asio::bind_executor(m_strand, std::forward<WriteHandler>(handler))
            );
        }

        template<typename EndPointSequence, typename ConnectHandler>
        auto asyncConnect(EndPointSequence const& endPoints, ConnectHandler&& handler)
        {
            return boost::asio::async_connect
            (
                m_object,
                endPoints,
                boost::asio::bind_executor(m_strand, std::forward<ConnectHandler>(handler))
            );
        }
    };

    template<>
    class WithStrand<boost::asio::ip::tcp::acceptor> :
        public Details::WithStrandBase<boost::asio::ip::tcp::acceptor>
    {
    public:
        using Details::WithStrandBase<boost::asio::ip::tcp::acceptor>::WithStrandBase;

        // The accepted socket is created on `socketExecutor`, its handler runs on the acceptor strand.
        template<typename Executor, typename AcceptHandler>
        auto asyncAccept(Executor const& socketExecutor, AcceptHandler&& handler)
        {
            return m_object.async_accept
            (
                socketExecutor,
                boost::asio::bind_executor(m_strand, std::forward<AcceptHandler>(handler))
            );
        }
    };

    template<>
    class WithStrand<boost::asio::steady_timer> :
        public Details::WithStrandBase<boost::asio::steady_timer>
    {
    public:
        using Details::WithStrandBase<boost::asio::steady_timer>::WithStrandBase;

        template<typename Rep, typename Period, typename WaitHandler>
        auto asyncWait(std::chrono::duration<Rep, Period> const timeout, WaitHandler&& waitHandler)
        {
            m_object.expires_after(timeout);
            m_object.async_wait
            (
                boost::asio::bind_executor(m_strand, std::forward<WaitHandler>(waitHandler))
            );
        }
    };

    template<typename Protocol>
    class WithStrand<boost::asio::ip::basic_resolver<Protocol>> :
        public Details::WithStrandBase<boost::asio::ip::basic_resolver<Protocol>>
    {
    public:
        using Details::WithStrandBase<boost::asio::ip::basic_resolver<Protocol>>::WithStrandBase;

        template<typename ResolveHandler>
        auto asyncResolve
        (
            std::string_view const host,
            std::string_view const service,
            ResolveHandler&& resolveHandler
        )
        {
            this->m_object.async_resolve
            (
                host,
                service,
                boost::asio::bind_executor(this->m_strand, std::forward<ResolveHandler>(resolveHandler))
            );
        }
    };
}

#pragma once
#include <IOManager.hpp>
#include <Mirror/Stream.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <array>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace TeeProxy::Tests
{
    using namespace std::chrono_literals;

    using ErrorCode = boost::system::error_code;
    using TCP = boost::asio::ip::tcp;
    using Strand = IOManager::StrandType;
    using IOResult = std::pair<ErrorCode, std::size_t>;

    // Runs an IOManager on a few threads for the lifetime of a test.
    struct IOManagerFixture
    {
        std::shared_ptr<IOManager> manager;
        IOManager::ObjectMaker maker;
        // Keeps the workers in run() while nothing is pending yet.
        boost::asio::executor_work_guard<Strand> work;
        std::vector<std::future<void>> futures;

        IOManagerFixture() :
            manager{ IOManager::create() },
            maker{ IOManager::ObjectMaker{ manager } },
            work{ boost::asio::make_work_guard(maker.makeStrand()) }
        {
            auto const launch = [this]
            {
                return std::async(std::launch::async, [manager = manager]
                {
                    while (not manager->stopped())
                    {
                        manager->run();
                        std::this_thread::sleep_for(1ms);
                    }
                });
            };

            futures.emplace_back(launch());
            futures.emplace_back(launch());
            futures.emplace_back(launch());
            futures.emplace_back(launch());
        }

        ~IOManagerFixture()
        {
            stop();
        }

        // Joins the worker threads; the context itself stays alive until destruction.
        void stop()
        {
            work.reset();
            manager->stop();
            futures.clear();
        }
    };

    template<typename T>
    T waitFor(std::future<T> future, std::chrono::milliseconds const timeout = 2s)
    {
        if (future.wait_for(timeout) != std::future_status::ready)
        {
            throw std::runtime_error{ "timed out waiting for the io context" };
        }
        return future.get();
    }

    template<typename Action>
    auto runOnStrand(Strand const& strand, Action action)
    {
        using Result = std::invoke_result_t<Action&>;
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();
        boost::asio::post(strand, [promise, action = std::move(action)]() mutable
        {
            try
            {
                if constexpr (std::is_void_v<Result>)
                {
                    action();
                    promise->set_value();
                }
                else
                {
                    promise->set_value(action());
                }
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        });
        return waitFor(std::move(future));
    }

    inline IOResult writeThrough
    (
        Strand const& strand,
        std::shared_ptr<Mirror::Stream> const& stream,
        std::string const& data
    )
    {
        auto const copy = std::make_shared<std::string>(data);
        auto promise = std::make_shared<std::promise<IOResult>>();
        auto future = promise->get_future();
        boost::asio::post(strand, [stream, copy, promise]
        {
            stream->asyncWrite(boost::asio::buffer(*copy), [copy, promise](ErrorCode const& code, std::size_t const bytes)
            {
                promise->set_value({ code, bytes });
            });
        });
        return waitFor(std::move(future));
    }

    inline std::pair<ErrorCode, std::string> readThrough
    (
        Strand const& strand,
        std::shared_ptr<Mirror::Stream> const& stream,
        std::size_t const size
    )
    {
        auto const buffer = std::make_shared<std::string>(size, '\0');
        auto promise = std::make_shared<std::promise<IOResult>>();
        auto future = promise->get_future();
        boost::asio::post(strand, [stream, buffer, promise]
        {
            stream->asyncReadSome(boost::asio::buffer(*buffer), [buffer, promise](ErrorCode const& code, std::size_t const bytes)
            {
                promise->set_value({ code, bytes });
            });
        });
        auto const [code, bytes] = waitFor(std::move(future));
        return { code, buffer->substr(0, bytes) };
    }

    inline ErrorCode closeThrough(Strand const& strand, std::shared_ptr<Mirror::Stream> const& stream)
    {
        return runOnStrand(strand, [stream] { return stream->close(); });
    }

    template<typename Predicate>
    bool eventually(Predicate&& predicate, std::chrono::milliseconds const timeout = 2s)
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    // A port nothing listens on, as far as loopback is concerned.
    inline std::uint16_t unusedPort()
    {
        auto context = boost::asio::io_context{};
        auto acceptor = TCP::acceptor{ context, TCP::endpoint{ boost::asio::ip::address_v4::loopback(), 0 } };
        return acceptor.local_endpoint().port();
    }

    // Listener whose accept queue is full, so further connection attempts are never answered.
    class UnresponsiveListener
    {
    private:
        boost::asio::io_context m_context;
        TCP::acceptor m_acceptor;
        std::vector<TCP::socket> m_queued;

    public:
        UnresponsiveListener() : m_acceptor{ m_context }
        {
            auto const endPoint = TCP::endpoint{ boost::asio::ip::address_v4::loopback(), 0 };
            m_acceptor.open(endPoint.protocol());
            m_acceptor.bind(endPoint);
            m_acceptor.listen(0);

            // The connects are started here and never completed: m_context is not run.
            m_queued.reserve(8);
            for (auto i = 0; i < 8; ++i)
            {
                auto& socket = m_queued.emplace_back(m_context);
                socket.async_connect(m_acceptor.local_endpoint(), [](ErrorCode const&) {});
            }
            std::this_thread::sleep_for(50ms);
        }

        std::uint16_t getPort() const
        {
            return m_acceptor.local_endpoint().port();
        }
    };

    // The far end of a connection, driven synchronously from the test thread.
    class TestPeer
    {
    private:
        boost::asio::io_context m_context;
        TCP::socket m_socket;

    public:
        TestPeer() : m_socket{ m_context } {}

        // Connects `far` to this peer over loopback.
        void pairWith(TCP::socket& far)
        {
            auto acceptor = TCP::acceptor{ m_context, TCP::endpoint{ boost::asio::ip::address_v4::loopback(), 0 } };
            far.connect(acceptor.local_endpoint());
            acceptor.accept(m_socket);
        }

        void connect(TCP::endpoint const& endPoint)
        {
            m_socket.connect(endPoint);
        }

        void send(std::string const& data)
        {
            boost::asio::write(m_socket, boost::asio::buffer(data));
        }

        // Returns what arrived before `size` bytes were read, the stream ended or `timeout` passed.
        std::string receive(std::size_t const size, std::chrono::milliseconds const timeout = 2s)
        {
            auto data = std::string(size, '\0');
            auto received = std::size_t{ 0 };
            boost::asio::async_read(m_socket, boost::asio::buffer(data), [&received](ErrorCode const&, std::size_t const bytes)
            {
                received = bytes;
            });
            runFor(timeout);
            data.resize(received);
            return data;
        }

        // True when the other side closed within `timeout`. Data read meanwhile is dropped.
        bool waitForClose(std::chrono::milliseconds const timeout = 2s)
        {
            auto closed = false;
            auto buffer = std::array<char, 4096>{};
            auto readMore = std::function<void()>{};
            readMore = [this, &closed, &buffer, &readMore]
            {
                m_socket.async_read_some(boost::asio::buffer(buffer), [&closed, &readMore](ErrorCode const& code, std::size_t)
                {
                    if (code == boost::asio::error::operation_aborted)
                    {
                        return;
                    }
                    if (code.failed())
                    {
                        closed = true;
                        return;
                    }
                    readMore();
                });
            };
            readMore();
            runFor(timeout);
            return closed;
        }

        void shutdownSend()
        {
            m_socket.shutdown(TCP::socket::shutdown_send);
        }

        void close()
        {
            m_socket.close();
        }

    private:
        void runFor(std::chrono::milliseconds const timeout)
        {
            m_context.restart();
            m_context.run_for(timeout);
            if (!m_context.stopped())
            {
                m_socket.cancel();
                m_context.restart();
                m_context.run();
            }
        }
    };

    // Loopback server standing in for a backend. Records everything it receives
    // and answers through `Reply`.
    class Backend
    {
    public:
        // Gets the latest chunk and everything the connection received so far.
        using Reply = std::function<std::string(std::string_view chunk, std::string const& connectionData)>;

    private:
        struct Session
        {
            explicit Session(TCP::socket socket) : socket{ std::move(socket) } {}

            TCP::socket socket;
            std::array<char, 4096> buffer;
            std::string received;
            std::string reply;
        };

        boost::asio::io_context m_context;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work;
        TCP::acceptor m_acceptor;
        TCP::endpoint m_endPoint;
        Reply m_reply;
        std::mutex mutable m_mutex;
        std::condition_variable mutable m_changed;
        std::string m_received;
        std::size_t m_connections;
        std::size_t m_disconnections;
        std::vector<std::weak_ptr<Session>> m_sessions;
        std::thread m_thread;

    public:
        explicit Backend(Reply reply = {}) :
            m_work{ boost::asio::make_work_guard(m_context) },
            m_acceptor{ m_context, TCP::endpoint{ boost::asio::ip::address_v4::loopback(), 0 } },
            m_endPoint{ m_acceptor.local_endpoint() },
            m_reply{ std::move(reply) },
            m_connections{ 0 },
            m_disconnections{ 0 }
        {
            acceptNext();
            m_thread = std::thread{ [this] { m_context.run(); } };
        }

        Backend(Backend const&) = delete;
        Backend& operator=(Backend const&) = delete;

        ~Backend()
        {
            m_context.stop();
            m_thread.join();
        }

        static Reply echo()
        {
            return [](std::string_view const chunk, std::string const&) { return std::string{ chunk }; };
        }

        TCP::endpoint const& getEndPoint() const noexcept { return m_endPoint; }

        std::uint16_t getPort() const noexcept { return m_endPoint.port(); }

        // Everything received on all connections, once at least `size` bytes arrived or `timeout` passed.
        std::string waitForData(std::size_t const size, std::chrono::milliseconds const timeout = 2s) const
        {
            auto lock = std::unique_lock{ m_mutex };
            m_changed.wait_for(lock, timeout, [&] { return m_received.size() >= size; });
            return m_received;
        }

        bool waitForDisconnections(std::size_t const count, std::chrono::milliseconds const timeout = 2s) const
        {
            auto lock = std::unique_lock{ m_mutex };
            return m_changed.wait_for(lock, timeout, [&] { return m_disconnections >= count; });
        }

        std::size_t getConnectionCount() const
        {
            auto const lock = std::scoped_lock{ m_mutex };
            return m_connections;
        }

    private:
        void acceptNext()
        {
            m_acceptor.async_accept([this](ErrorCode const& code, TCP::socket socket)
            {
                if (code.failed())
                {
                    return;
                }

                auto const session = std::make_shared<Session>(std::move(socket));
                {
                    auto const lock = std::scoped_lock{ m_mutex };
                    ++m_connections;
                    m_sessions.push_back(session);
                }
                m_changed.notify_all();
                readFrom(session);
                acceptNext();
            });
        }

        void readFrom(std::shared_ptr<Session> const& session)
        {
            session->socket.async_read_some(boost::asio::buffer(session->buffer), [this, session](ErrorCode const& code, std::size_t const bytes)
            {
                if (code.failed())
                {
                    {
                        auto const lock = std::scoped_lock{ m_mutex };
                        ++m_disconnections;
                    }
                    m_changed.notify_all();
                    return;
                }

                auto const chunk = std::string_view{ session->buffer.data(), bytes };
                session->received.append(chunk);
                {
                    auto const lock = std::scoped_lock{ m_mutex };
                    m_received.append(chunk);
                }
                m_changed.notify_all();

                session->reply = m_reply ? m_reply(chunk, session->received) : std::string{};
                if (session->reply.empty())
                {
                    return readFrom(session);
                }

                boost::asio::async_write(session->socket, boost::asio::buffer(session->reply), [this, session](ErrorCode const& code, std::size_t)
                {
                    if (code.failed())
                    {
                        return;
                    }
                    readFrom(session);
                });
            });
        }
    };
}

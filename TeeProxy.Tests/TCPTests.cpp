#include <boost/test/unit_test.hpp>
#include "TestHelpers.hpp"
#include <Configuration/Configuration.hpp>
#include <Mirror/Acceptor.hpp>
#include <Mirror/Connector.hpp>
#include <Mirror/Tee.hpp>

using namespace TeeProxy::Tests;
using TeeProxy::Configuration::Configuration;
using TeeProxy::Configuration::HostAndPort;
using TeeProxy::Mirror::Acceptor;
using TeeProxy::Mirror::Connector;
using TeeProxy::Mirror::Tee;

namespace
{
    Backend::Reply pingPong()
    {
        return [](std::string_view, std::string const& connectionData)
        {
            return connectionData == "PING" ? std::string{ "PONG" } : std::string{};
        };
    }

    HostAndPort loopback(std::uint16_t const port)
    {
        return HostAndPort{ "127.0.0.1", port };
    }

    struct ProxyFixture : IOManagerFixture
    {
        std::shared_ptr<Tee::Pool> pool = Tee::createPool(16);
        std::shared_ptr<Acceptor> acceptor;

        ~ProxyFixture()
        {
            if (acceptor)
            {
                acceptor->stop();
            }
            stop();
        }

        static Configuration makeConfiguration(std::uint16_t const productionPort, std::optional<std::uint16_t> const shadowPort)
        {
            auto configuration = Configuration{};
            configuration.production = loopback(productionPort);
            configuration.shadow.reset();
            if (shadowPort.has_value())
            {
                configuration.shadow = loopback(*shadowPort);
            }
            configuration.timeout = 2s;
            configuration.linger = 100ms;
            return configuration;
        }

        void start(Configuration configuration, HostAndPort const& listen = loopback(0))
        {
            configuration.listen = listen;
            configuration.threads = 2;
            configuration.validate();
            auto const shared = std::make_shared<Configuration const>(std::move(configuration));
            acceptor = Acceptor::create(maker, shared, Connector::create(shared, pool));
            BOOST_TEST_MESSAGE("Proxy listening on " << acceptor->getLocalEndPoint());
        }

        TCP::endpoint getProxyEndPoint() const
        {
            return acceptor->getLocalEndPoint();
        }
    };
}

BOOST_FIXTURE_TEST_SUITE(TCPTests, ProxyFixture)

BOOST_AUTO_TEST_CASE(ClientGetsProductionReplyWhileShadowStaysSilent)
{
    auto const production = Backend{ pingPong() };
    auto const shadow = Backend{};
    start(makeConfiguration(production.getPort(), shadow.getPort()));

    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    client.send("PING");
    BOOST_TEST(client.receive(4) == "PONG");
    BOOST_TEST(shadow.waitForData(4) == "PING");
}

BOOST_AUTO_TEST_CASE(ExactBytesReachBothBackends)
{
    auto const production = Backend{};
    auto const shadow = Backend{};
    start(makeConfiguration(production.getPort(), shadow.getPort()));

    auto payload = std::string{};
    for (auto i = 0; i < 200 * 1024; ++i)
    {
        payload.push_back(static_cast<char>(i * 7 % 256));
    }

    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    for (auto offset = std::size_t{ 0 }; offset < payload.size(); offset += 10000)
    {
        client.send(payload.substr(offset, 10000));
    }

    BOOST_TEST(production.waitForData(payload.size()) == payload);
    BOOST_TEST(shadow.waitForData(payload.size()) == payload);
}

BOOST_AUTO_TEST_CASE(ShadowNotListening)
{
    auto const production = Backend{ pingPong() };
    start(makeConfiguration(production.getPort(), unusedPort()));

    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    client.send("PING");
    BOOST_TEST(client.receive(4) == "PONG");
}

BOOST_AUTO_TEST_CASE(UnansweredShadowDialOnlyDelaysByDeadline)
{
    auto const production = Backend{ pingPong() };
    auto const shadow = UnresponsiveListener{};
    auto configuration = makeConfiguration(production.getPort(), shadow.getPort());
    configuration.shadowDeadline = 100ms;
    start(configuration);

    auto const started = std::chrono::steady_clock::now();
    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    client.send("PING");
    BOOST_TEST(client.receive(4) == "PONG");

    auto const elapsed = std::chrono::steady_clock::now() - started;
    BOOST_TEST((elapsed >= 90ms));
    BOOST_TEST((elapsed < 800ms));
    BOOST_TEST(pool->getStatistics().allocated == 0u);
}

BOOST_AUTO_TEST_CASE(UnansweredProductionDialClosesClientAtDeadline)
{
    auto const production = UnresponsiveListener{};
    auto const shadow = Backend{};
    auto configuration = makeConfiguration(production.getPort(), shadow.getPort());
    configuration.productionDeadline = 200ms;
    start(configuration);

    auto const started = std::chrono::steady_clock::now();
    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    BOOST_TEST(client.waitForClose(3s));

    auto const elapsed = std::chrono::steady_clock::now() - started;
    BOOST_TEST((elapsed >= 180ms));
    BOOST_TEST((elapsed < 1s));
    BOOST_TEST(shadow.getConnectionCount() == 0u);
}

BOOST_AUTO_TEST_CASE(EmptyListenHostAcceptsEveryLoopback)
{
    auto const production = Backend{ pingPong() };
    start(makeConfiguration(production.getPort(), std::nullopt), HostAndPort{ "", 0 });

    auto const local = getProxyEndPoint();
    BOOST_TEST(local.address().is_unspecified());

    auto v4Client = TestPeer{};
    v4Client.connect(TCP::endpoint{ boost::asio::ip::address_v4::loopback(), local.port() });
    v4Client.send("PING");
    BOOST_TEST(v4Client.receive(4) == "PONG");

    if (local.address().is_v6())
    {
        auto v6Client = TestPeer{};
        v6Client.connect(TCP::endpoint{ boost::asio::ip::address_v6::loopback(), local.port() });
        v6Client.send("PING");
        BOOST_TEST(v6Client.receive(4) == "PONG");
    }
}

BOOST_AUTO_TEST_CASE(MirroringDisabled)
{
    auto const production = Backend{ pingPong() };
    start(makeConfiguration(production.getPort(), std::nullopt));

    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    client.send("PING");
    BOOST_TEST(client.receive(4) == "PONG");
    BOOST_TEST(pool->getStatistics().allocated == 0u);
}

BOOST_AUTO_TEST_CASE(TimeoutClosesClientAndProduction)
{
    auto const production = Backend{};
    auto const shadow = Backend{};
    auto configuration = makeConfiguration(production.getPort(), shadow.getPort());
    configuration.timeout = 300ms;
    start(configuration);

    auto const started = std::chrono::steady_clock::now();
    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    client.send("hi");

    BOOST_TEST(client.waitForClose(3s));
    BOOST_TEST((std::chrono::steady_clock::now() - started >= 250ms));
    BOOST_TEST(production.waitForDisconnections(1));
    BOOST_TEST(shadow.waitForDisconnections(1));
}

BOOST_AUTO_TEST_CASE(UnreachableProductionClosesClient)
{
    auto const shadow = Backend{};
    start(makeConfiguration(unusedPort(), shadow.getPort()));

    auto client = TestPeer{};
    client.connect(getProxyEndPoint());
    BOOST_TEST(client.waitForClose(1s));
    BOOST_TEST(shadow.getConnectionCount() == 0u);
}

BOOST_AUTO_TEST_CASE(ConcurrentEchoClients)
{
    auto constexpr n = 10;
    auto const production = Backend{ Backend::echo() };
    auto const shadow = Backend{ Backend::echo() };
    start(makeConfiguration(production.getPort(), shadow.getPort()));

    auto const clientCode = [this](int const i)
    {
        auto const message = "HELLO" + std::string(1, '\0') + std::to_string(i);
        auto client = TestPeer{};
        client.connect(getProxyEndPoint());
        client.send(message);
        return client.receive(message.size()) == message;
    };

    auto clientTasks = std::vector<std::future<bool>>{};
    for (auto i = 0; i < n; ++i)
    {
        clientTasks.emplace_back(std::async(std::launch::async, clientCode, i));
    }

    auto expectedSize = std::size_t{ 0 };
    for (auto i = 0; i < n; ++i)
    {
        BOOST_TEST_CHECKPOINT("Client " << i);
        BOOST_TEST(clientTasks.at(i).get());
        expectedSize += 6 + std::to_string(i).size();
    }

    BOOST_TEST(shadow.waitForData(expectedSize).size() == expectedSize);
    BOOST_TEST(shadow.getConnectionCount() == static_cast<std::size_t>(n));
    BOOST_TEST(production.getConnectionCount() == static_cast<std::size_t>(n));
}

BOOST_AUTO_TEST_SUITE_END()

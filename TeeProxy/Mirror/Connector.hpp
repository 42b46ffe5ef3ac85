#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Configuration/Configuration.hpp>
#include <Mirror/Dialer.hpp>
#include <Mirror/Stream.hpp>
#include <Mirror/Tee.hpp>

namespace TeeProxy::Mirror
{
    // Opens the upstream side of a connection: A is mandatory, B is best effort.
    // Produces a Tee over both when B is reachable, otherwise A's bare stream.
    class Connector : public std::enable_shared_from_this<Connector>
    {
    public:
        using Strand = IOManager::StrandType;
        using ErrorCode = boost::system::error_code;
        using Configuration = ::TeeProxy::Configuration::Configuration;
        using Handler = std::function<void(ErrorCode const&, std::shared_ptr<Stream>)>;
    private:
        struct PrivateConstructor {};

    public:
        static constexpr auto description = "Connector";
    private:
        std::shared_ptr<Configuration const> m_configuration;
        std::shared_ptr<Tee::Pool> m_pool;

    public:
        static std::shared_ptr<Connector> create
        (
            std::shared_ptr<Configuration const> configuration,
            std::shared_ptr<Tee::Pool> pool
        );

        Connector
        (
            PrivateConstructor,
            std::shared_ptr<Configuration const>&& configuration,
            std::shared_ptr<Tee::Pool>&& pool
        );

        // On failure the handler gets A's error and a null stream.
        void asyncConnect(Strand const& strand, Handler handler) const;

    private:
        void connectShadow
        (
            Strand const& strand,
            std::shared_ptr<Stream> production,
            Handler handler
        ) const;
    };
}

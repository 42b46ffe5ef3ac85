#include <IOManager.hpp>
#include <Configuration/Configuration.hpp>
#include <Logging/Logging.hpp>
#include <Mirror/Acceptor.hpp>
#include <Mirror/Connector.hpp>
#include <Mirror/Tee.hpp>
#include <iostream>

using TeeProxy::IOManager;
using TeeProxy::Configuration::Configuration;
using TeeProxy::Configuration::ConfigurationError;
using TeeProxy::Configuration::formatDuration;
using TeeProxy::Logging::logLine;
using TeeProxy::Logging::Level;
using TeeProxy::Mirror::Acceptor;
using TeeProxy::Mirror::Connector;
using TeeProxy::Mirror::Tee;

using ErrorCode = boost::system::error_code;
using SignalSet = boost::asio::signal_set;
using Timer = boost::asio::steady_timer;

struct Main
{
    static constexpr auto description = "Main";

    enum ExitCode : int
    {
        success = 0,
        failure = 1,
        badConfiguration = 2
    };

    template<typename... Arguments>
    static void logLine(Level const level, Arguments&&... arguments)
    {
        return ::logLine<Main>(level, std::forward<Arguments>(arguments)...);
    }

    // Stops accepting, then gives running connections and b drains
    // `gracePeriod` to finish before the io context is stopped.
    static void beginShutdown
    (
        IOManager& manager,
        Acceptor& acceptor,
        std::shared_ptr<Timer> const& forceStopTimer,
        Configuration const& configuration,
        ErrorCode const& errorCode,
        int const signal
    )
    {
        if (errorCode == boost::asio::error::operation_aborted)
        {
            return;
        }
        if (errorCode.failed())
        {
            logLine(Level::error, "Signal async wait failed: ", errorCode.message());
        }
        else
        {
            logLine(Level::info, "Received signal ", signal);
        }

        acceptor.stop();

        auto const gracePeriod = configuration.timeout + configuration.linger + std::chrono::seconds{ 1 };
        logLine(Level::info, "Shutting down, waiting up to ", formatDuration(gracePeriod), " for open connections.");
        forceStopTimer->expires_after(gracePeriod);
        forceStopTimer->async_wait([m = manager.weak_from_this(), forceStopTimer](ErrorCode const& code)
        {
            if (code == boost::asio::error::operation_aborted)
            {
                return;
            }
            if (auto const manager = m.lock())
            {
                logLine(Level::warning, "Grace period over, cancelling remaining connections.");
                manager->stop();
            }
        });
    }

    static int run(int const argc, char const* const* const argv)
    {
        auto parsed = std::optional<Configuration>{};
        try
        {
            parsed = TeeProxy::Configuration::parseCommandLine(argc, argv, std::cout);
        }
        catch (ConfigurationError const& error)
        {
            std::cerr << error.what() << "\n\n";
            TeeProxy::Configuration::printUsage(std::cerr);
            return badConfiguration;
        }
        if (!parsed.has_value())
        {
            return success;
        }

        auto const configuration = std::make_shared<Configuration const>(std::move(parsed.value()));
        auto loggingOptions = TeeProxy::Logging::Options{};
        loggingOptions.filterLevel = configuration->debug ? Level::debug : Level::info;
        loggingOptions.fileName = configuration->logFile;
        TeeProxy::Logging::initialize(loggingOptions);

        logLine(Level::info, "teeproxy");
        logLine(Level::info, *configuration);
        try
        {
            auto const ioManager = IOManager::create();
            auto objectMaker = IOManager::ObjectMaker{ ioManager };

            auto const pool = Tee::createPool(configuration->poolCapacity);
            auto const connector = Connector::create(configuration, pool);
            auto const acceptor = Acceptor::create(objectMaker, configuration, connector);

            auto const forceStopTimer = std::make_shared<Timer>(objectMaker.make<Timer>());
            auto signals = objectMaker.make<SignalSet>(SIGINT, SIGTERM);
            signals.async_wait
            (
                [ioManager = ioManager->weak_from_this(), acceptor, forceStopTimer, configuration]
                (ErrorCode const& code, int const signal)
                {
                    if (auto const manager = ioManager.lock())
                    {
                        beginShutdown(*manager, *acceptor, forceStopTimer, *configuration, code, signal);
                    }
                }
            );

            ioManager->runOnThreads(configuration->threads);

            auto const statistics = pool->getStatistics();
            logLine
            (
                Level::info,
                "Tee pool: ", statistics.allocated, " allocated, ", statistics.reused, " reused, ",
                statistics.discarded, " discarded"
            );
        }
        catch (boost::system::system_error const& error)
        {
            logLine(Level::fatal, "Cannot serve ", configuration->listen, ": ", error.what());
            return failure;
        }
        catch (std::exception const& error)
        {
            logLine(Level::fatal, "Unhandled exception: ", error.what());
            return failure;
        }
        logLine(Level::info, "End");
        return success;
    }
};



int main(int argc, char* argv[])
{
    try
    {
        return Main::run(argc, argv);
    }
    catch (std::exception const& error)
    {
        logLine<Main>(Level::fatal, "Unhandled exception: ", error.what());
    }
    catch (...)
    {
        logLine<Main>(Level::fatal, "Unknown exception");
    }
    return Main::failure;
}

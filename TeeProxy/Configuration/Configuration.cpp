#include <precompiled.hpp>
#include "Configuration.hpp"
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace TeeProxy::Configuration
{
    namespace
    {
        po::options_description makeOptions()
        {
            auto const defaults = Configuration{};
            auto options = po::options_description{ "Options" };
            options.add_options()
                ("help,h", "print this help")
                ("listen,l", po::value<std::string>()->default_value(defaults.listen.toString()), "port to accept requests")
                (",a", po::value<std::string>()->default_value(defaults.production.toString()), "where production traffic goes")
                (",b", po::value<std::string>()->default_value(defaults.shadow->toString()), "where testing traffic goes, responses are skipped; empty disables mirroring")
                ("linger", po::value<std::string>()->default_value(formatDuration(defaults.linger)), "time to finish reading from b before terminating connection")
                ("timeout", po::value<std::string>()->default_value(formatDuration(defaults.timeout)), "total request timeout")
                ("deadline", po::value<std::string>()->default_value(formatDuration(defaults.shadowDeadline)), "deadline to establish connections to b")
                ("a-deadline", po::value<std::string>()->default_value(formatDuration(defaults.productionDeadline)), "deadline to establish connections to a")
                ("log-threshold", po::value<std::string>()->default_value(formatDuration(defaults.logThreshold)), "request duration before logging")
                ("debug", po::bool_switch(), "debug logging")
                ("threads", po::value<std::size_t>()->default_value(defaults.threads), "worker threads and accept loops")
                ("shadow-backlog", po::value<std::size_t>()->default_value(defaults.shadowBacklogLimit), "bytes buffered for b before mirroring is abandoned")
                ("log-file", po::value<std::string>(), "also log to this file (rotated every MiB)");
            return options;
        }

        Duration durationOption(po::variables_map const& values, char const* const name)
        {
            return parseDuration(values[name].as<std::string>());
        }
    }

    void Configuration::validate() const
    {
        auto const requirePositive = [](Duration const value, std::string_view const name)
        {
            if (value <= Duration::zero())
            {
                throw ConfigurationError{ std::string{ name } + " must be positive" };
            }
        };

        requirePositive(timeout, "timeout");
        requirePositive(shadowDeadline, "deadline");
        requirePositive(productionDeadline, "a-deadline");

        if (linger < Duration::zero())
        {
            throw ConfigurationError{ "linger must not be negative" };
        }
        if (logThreshold < Duration::zero())
        {
            throw ConfigurationError{ "log-threshold must not be negative" };
        }
        auto const productionDeadlineLimitFits = timeout <= Duration::max() / maxProductionDeadlineFactor;
        if (productionDeadlineLimitFits && productionDeadline > timeout * maxProductionDeadlineFactor)
        {
            throw ConfigurationError
            {
                "a-deadline (" + formatDuration(productionDeadline) + ") must not exceed " +
                std::to_string(maxProductionDeadlineFactor) + " x timeout (" + formatDuration(timeout) + ")"
            };
        }
        if (production.host.empty() || production.port == 0)
        {
            throw ConfigurationError{ "a needs both a host and a port" };
        }
        if (shadow.has_value() && (shadow->host.empty() || shadow->port == 0))
        {
            throw ConfigurationError{ "b needs both a host and a port" };
        }
        if (threads == 0)
        {
            throw ConfigurationError{ "threads must be at least 1" };
        }
        if (poolCapacity == 0)
        {
            throw ConfigurationError{ "pool capacity must be at least 1" };
        }
    }

    std::optional<Configuration> parseCommandLine
    (
        int const argc,
        char const* const* const argv,
        std::ostream& output
    )
    {
        auto const options = makeOptions();
        auto values = po::variables_map{};
        try
        {
            po::store(po::parse_command_line(argc, argv, options), values);
            po::notify(values);
        }
        catch (po::error const& error)
        {
            throw ConfigurationError{ error.what() };
        }

        if (values.count("help") != 0)
        {
            output << options;
            return std::nullopt;
        }

        auto configuration = Configuration{};
        configuration.listen = HostAndPort::parse(values["listen"].as<std::string>());
        configuration.production = HostAndPort::parse(values["-a"].as<std::string>());

        auto const shadow = values["-b"].as<std::string>();
        if (shadow.empty())
        {
            configuration.shadow.reset();
        }
        else
        {
            configuration.shadow = HostAndPort::parse(shadow);
        }

        configuration.linger = durationOption(values, "linger");
        configuration.timeout = durationOption(values, "timeout");
        configuration.shadowDeadline = durationOption(values, "deadline");
        configuration.productionDeadline = durationOption(values, "a-deadline");
        configuration.logThreshold = durationOption(values, "log-threshold");
        configuration.debug = values["debug"].as<bool>();
        configuration.threads = values["threads"].as<std::size_t>();
        configuration.shadowBacklogLimit = values["shadow-backlog"].as<std::size_t>();
        if (values.count("log-file") != 0)
        {
            configuration.logFile = values["log-file"].as<std::string>();
        }

        configuration.validate();
        return configuration;
    }

    void printUsage(std::ostream& output)
    {
        output << makeOptions();
    }

    std::ostream& operator<<(std::ostream& stream, Configuration const& configuration)
    {
        return stream
            << "listen: " << configuration.listen
            << ", a: " << configuration.production
            << ", b: " << (configuration.shadow.has_value() ? configuration.shadow->toString() : "(disabled)")
            << ", deadline: " << formatDuration(configuration.shadowDeadline)
            << ", a-deadline: " << formatDuration(configuration.productionDeadline)
            << ", linger: " << formatDuration(configuration.linger)
            << ", timeout: " << formatDuration(configuration.timeout)
            << ", log-threshold: " << formatDuration(configuration.logThreshold)
            << ", threads: " << configuration.threads;
    }
}

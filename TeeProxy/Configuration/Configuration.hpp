#pragma once
#include <precompiled.hpp>
#include <Configuration/ConfigurationError.hpp>
#include <Configuration/Duration.hpp>
#include <Configuration/HostAndPort.hpp>

namespace TeeProxy::Configuration
{
    // Immutable settings built once at startup.
    struct Configuration
    {
        // Upper bound of productionDeadline relative to timeout.
        static constexpr auto maxProductionDeadlineFactor = 5;

        HostAndPort listen = HostAndPort{ "", 8888 };
        HostAndPort production = HostAndPort{ "localhost", 8080 };
        // Mirroring is disabled when empty.
        std::optional<HostAndPort> shadow = HostAndPort{ "localhost", 8081 };
        Duration linger = std::chrono::milliseconds{ 200 };
        Duration timeout = std::chrono::seconds{ 1 };
        Duration shadowDeadline = std::chrono::milliseconds{ 100 };
        Duration productionDeadline = std::chrono::seconds{ 1 };
        Duration logThreshold = std::chrono::milliseconds{ 500 };
        bool debug = false;
        std::size_t threads = std::max(1u, std::thread::hardware_concurrency());
        std::size_t shadowBacklogLimit = 4 * 1024 * 1024;
        std::size_t poolCapacity = 1024;
        std::optional<std::string> logFile;

        // Throws ConfigurationError when a value is out of range.
        void validate() const;
    };

    // Returns std::nullopt when help was requested; the usage text has then
    // been written to `output`. Throws ConfigurationError on invalid input.
    std::optional<Configuration> parseCommandLine
    (
        int argc,
        char const* const* argv,
        std::ostream& output
    );

    void printUsage(std::ostream& output);

    std::ostream& operator<<(std::ostream& stream, Configuration const& configuration);
}

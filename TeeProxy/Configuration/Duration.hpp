#pragma once
#include <precompiled.hpp>

namespace TeeProxy::Configuration
{
    using Duration = std::chrono::nanoseconds;

    // Parses durations such as "200ms", "1.5s" or "1m30s".
    // Accepted units: ns, us, ms, s, m, h. A bare "0" is accepted.
    // Throws ConfigurationError on malformed or negative input.
    Duration parseDuration(std::string_view text);

    // Inverse of parseDuration for log output: "200ms", "1.5s", "0s".
    std::string formatDuration(Duration duration);
}

#include <precompiled.hpp>
#include "Duration.hpp"
#include <Configuration/ConfigurationError.hpp>
#include <cmath>
#include <iomanip>

namespace TeeProxy::Configuration
{
    namespace
    {
        struct Unit
        {
            std::string_view suffix;
            double nanoseconds;
        };

        // Longer suffixes first so "ms" is not taken for "m".
        constexpr auto units = std::array<Unit, 6>
        {
            Unit{ "ns", 1.0 },
            Unit{ "us", 1e3 },
            Unit{ "ms", 1e6 },
            Unit{ "s", 1e9 },
            Unit{ "m", 60e9 },
            Unit{ "h", 3600e9 }
        };

        [[noreturn]] void fail(std::string_view const text, std::string_view const reason)
        {
            throw ConfigurationError{ "invalid duration \"" + std::string{ text } + "\": " + std::string{ reason } };
        }

        bool isDigit(char const c) noexcept
        {
            return c >= '0' && c <= '9';
        }
    }

    Duration parseDuration(std::string_view const text)
    {
        if (text.empty())
        {
            fail(text, "empty");
        }
        if (text == "0")
        {
            return Duration::zero();
        }
        if (text.front() == '-')
        {
            fail(text, "negative");
        }

        auto total = 0.0;
        auto rest = text;
        if (rest.front() == '+')
        {
            rest.remove_prefix(1);
        }
        if (rest.empty())
        {
            fail(text, "missing value");
        }

        while (!rest.empty())
        {
            auto numberLength = std::size_t{ 0 };
            auto seenDigit = false;
            auto seenDot = false;
            while (numberLength < rest.size())
            {
                auto const c = rest[numberLength];
                if (isDigit(c))
                {
                    seenDigit = true;
                }
                else if (c == '.' && !seenDot)
                {
                    seenDot = true;
                }
                else
                {
                    break;
                }
                ++numberLength;
            }
            if (!seenDigit)
            {
                fail(text, "expected a number");
            }

            auto const value = std::stod(std::string{ rest.substr(0, numberLength) });
            rest.remove_prefix(numberLength);

            auto unitLength = std::size_t{ 0 };
            while (unitLength < rest.size() && !isDigit(rest[unitLength]) && rest[unitLength] != '.')
            {
                ++unitLength;
            }
            if (unitLength == 0)
            {
                fail(text, "missing unit");
            }

            auto const suffix = rest.substr(0, unitLength);
            auto const unit = std::find_if(units.begin(), units.end(), [suffix](Unit const& candidate)
            {
                return candidate.suffix == suffix;
            });
            if (unit == units.end())
            {
                fail(text, "unknown unit \"" + std::string{ suffix } + "\"");
            }
            rest.remove_prefix(unitLength);

            total += value * unit->nanoseconds;
        }

        // The double nearest to max() is 2^63, one past the range.
        if (total >= static_cast<double>(Duration::max().count()))
        {
            fail(text, "out of range");
        }

        return Duration{ static_cast<Duration::rep>(std::llround(total)) };
    }

    std::string formatDuration(Duration const duration)
    {
        using namespace std::chrono_literals;

        auto const count = duration.count();
        if (count == 0)
        {
            return "0s";
        }

        auto const magnitude = duration < Duration::zero() ? -duration : duration;
        auto scale = 1.0;
        auto suffix = std::string_view{ "ns" };
        if (magnitude >= 1s)
        {
            scale = 1e9;
            suffix = "s";
        }
        else if (magnitude >= 1ms)
        {
            scale = 1e6;
            suffix = "ms";
        }
        else if (magnitude >= 1us)
        {
            scale = 1e3;
            suffix = "us";
        }

        auto stream = std::ostringstream{};
        stream << std::fixed << std::setprecision(6) << (static_cast<double>(count) / scale);
        auto text = stream.str();
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.')
        {
            text.pop_back();
        }
        return text + std::string{ suffix };
    }
}

#include <boost/test/unit_test.hpp>
#include <Configuration/Configuration.hpp>
#include <sstream>

using namespace TeeProxy::Configuration;
using namespace std::chrono_literals;

namespace
{
    std::optional<Configuration> parse(std::vector<std::string> arguments, std::ostream& output)
    {
        arguments.insert(arguments.begin(), "teeproxy");
        auto argv = std::vector<char const*>{};
        for (auto const& argument : arguments)
        {
            argv.push_back(argument.c_str());
        }
        return parseCommandLine(static_cast<int>(argv.size()), argv.data(), output);
    }

    Configuration parse(std::vector<std::string> arguments)
    {
        auto output = std::ostringstream{};
        auto const result = parse(std::move(arguments), output);
        BOOST_REQUIRE(result.has_value());
        return result.value();
    }
}

BOOST_AUTO_TEST_SUITE(DurationTests)

BOOST_AUTO_TEST_CASE(ParsesUnitsAndCombinations)
{
    BOOST_TEST(parseDuration("200ms").count() == Duration{ 200ms }.count());
    BOOST_TEST(parseDuration("1s").count() == Duration{ 1s }.count());
    BOOST_TEST(parseDuration("1.5s").count() == Duration{ 1500ms }.count());
    BOOST_TEST(parseDuration("1m30s").count() == Duration{ 90s }.count());
    BOOST_TEST(parseDuration("2h").count() == Duration{ 2h }.count());
    BOOST_TEST(parseDuration("10us").count() == Duration{ 10us }.count());
    BOOST_TEST(parseDuration("7ns").count() == 7);
    BOOST_TEST(parseDuration("0").count() == 0);
}

BOOST_AUTO_TEST_CASE(RejectsMalformedInput)
{
    BOOST_CHECK_THROW(parseDuration(""), ConfigurationError);
    BOOST_CHECK_THROW(parseDuration("10"), ConfigurationError);
    BOOST_CHECK_THROW(parseDuration("-1s"), ConfigurationError);
    BOOST_CHECK_THROW(parseDuration("5 parsecs"), ConfigurationError);
    BOOST_CHECK_THROW(parseDuration("ms"), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(RejectsDurationsBeyondRange)
{
    BOOST_CHECK_THROW(parseDuration("9223372036854775807ns"), ConfigurationError);
    BOOST_CHECK_THROW(parseDuration("2562048h"), ConfigurationError);
    BOOST_TEST(parseDuration("2562047h").count() == Duration{ std::chrono::hours{ 2562047 } }.count());
}

BOOST_AUTO_TEST_CASE(FormatsForLogs)
{
    BOOST_TEST(formatDuration(Duration::zero()) == "0s");
    BOOST_TEST(formatDuration(200ms) == "200ms");
    BOOST_TEST(formatDuration(1500ms) == "1.5s");
    BOOST_TEST(formatDuration(1234us) == "1.234ms");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(HostAndPortTests)

BOOST_AUTO_TEST_CASE(ParsesHostAndPort)
{
    BOOST_TEST(HostAndPort::parse("localhost:8080") == (HostAndPort{ "localhost", 8080 }));
    BOOST_TEST(HostAndPort::parse(":8888") == (HostAndPort{ "", 8888 }));
    BOOST_TEST(HostAndPort::parse("[::1]:9000") == (HostAndPort{ "::1", 9000 }));
    BOOST_TEST(HostAndPort::parse("[::1]:9000").toString() == "[::1]:9000");
    BOOST_TEST(HostAndPort::parse("10.0.0.1:1").getService() == "1");
}

BOOST_AUTO_TEST_CASE(RejectsBadAddresses)
{
    BOOST_CHECK_THROW(HostAndPort::parse("localhost"), ConfigurationError);
    BOOST_CHECK_THROW(HostAndPort::parse("localhost:http"), ConfigurationError);
    BOOST_CHECK_THROW(HostAndPort::parse("localhost:70000"), ConfigurationError);
    BOOST_CHECK_THROW(HostAndPort::parse("::1:9000"), ConfigurationError);
    BOOST_CHECK_THROW(HostAndPort::parse("[::1:9000"), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CommandLineTests)

BOOST_AUTO_TEST_CASE(DefaultsWithoutArguments)
{
    auto const configuration = parse({});
    BOOST_TEST(configuration.listen == (HostAndPort{ "", 8888 }));
    BOOST_TEST(configuration.production == (HostAndPort{ "localhost", 8080 }));
    BOOST_REQUIRE(configuration.shadow.has_value());
    BOOST_TEST(*configuration.shadow == (HostAndPort{ "localhost", 8081 }));
    BOOST_TEST(configuration.linger.count() == Duration{ 200ms }.count());
    BOOST_TEST(configuration.timeout.count() == Duration{ 1s }.count());
    BOOST_TEST(configuration.shadowDeadline.count() == Duration{ 100ms }.count());
    BOOST_TEST(configuration.productionDeadline.count() == Duration{ 1s }.count());
    BOOST_TEST(configuration.logThreshold.count() == Duration{ 500ms }.count());
    BOOST_TEST(!configuration.debug);
    BOOST_TEST(!configuration.logFile.has_value());
}

BOOST_AUTO_TEST_CASE(ReadsEveryOption)
{
    auto const configuration = parse
    ({
        "-l", "127.0.0.1:9999",
        "-a", "prod.internal:80",
        "-b", "shadow.internal:81",
        "--linger", "1s",
        "--timeout", "3s",
        "--deadline", "50ms",
        "--a-deadline", "2s",
        "--log-threshold", "0",
        "--debug",
        "--threads", "3",
        "--shadow-backlog", "1024",
        "--log-file", "teeproxy"
    });
    BOOST_TEST(configuration.listen == (HostAndPort{ "127.0.0.1", 9999 }));
    BOOST_TEST(configuration.production == (HostAndPort{ "prod.internal", 80 }));
    BOOST_TEST(*configuration.shadow == (HostAndPort{ "shadow.internal", 81 }));
    BOOST_TEST(configuration.linger.count() == Duration{ 1s }.count());
    BOOST_TEST(configuration.timeout.count() == Duration{ 3s }.count());
    BOOST_TEST(configuration.shadowDeadline.count() == Duration{ 50ms }.count());
    BOOST_TEST(configuration.productionDeadline.count() == Duration{ 2s }.count());
    BOOST_TEST(configuration.logThreshold.count() == 0);
    BOOST_TEST(configuration.debug);
    BOOST_TEST(configuration.threads == 3u);
    BOOST_TEST(configuration.shadowBacklogLimit == 1024u);
    BOOST_TEST(configuration.logFile.value() == "teeproxy");
}

BOOST_AUTO_TEST_CASE(EmptyShadowDisablesMirroring)
{
    BOOST_TEST(!parse({ "-b", "" }).shadow.has_value());
}

BOOST_AUTO_TEST_CASE(HelpPrintsUsage)
{
    auto output = std::ostringstream{};
    BOOST_TEST(!parse({ "--help" }, output).has_value());
    BOOST_TEST(output.str().find("--linger") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(ProductionDeadlineLimitWithHugeTimeout)
{
    auto const configuration = parse({ "--timeout", "2562047h", "--a-deadline", "1s" });
    BOOST_TEST(configuration.timeout.count() == Duration{ std::chrono::hours{ 2562047 } }.count());
    BOOST_TEST(configuration.productionDeadline.count() == Duration{ 1s }.count());

    auto const atLimit = parse({ "--timeout", "1s", "--a-deadline", "5s" });
    BOOST_TEST(atLimit.productionDeadline.count() == Duration{ 5s }.count());
}

BOOST_AUTO_TEST_CASE(RejectsInvalidCommandLines)
{
    BOOST_CHECK_THROW(parse({ "--no-such-option" }), ConfigurationError);
    BOOST_CHECK_THROW(parse({ "--timeout", "soon" }), ConfigurationError);
    BOOST_CHECK_THROW(parse({ "--timeout", "0" }), ConfigurationError);
    BOOST_CHECK_THROW(parse({ "--timeout", "1s", "--a-deadline", "6s" }), ConfigurationError);
    BOOST_CHECK_THROW(parse({ "-a", ":8080" }), ConfigurationError);
    BOOST_CHECK_THROW(parse({ "--threads", "0" }), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_MODULE TeeProxyTests
#include <boost/test/included/unit_test.hpp>
#include <Logging/Logging.hpp>

struct LoggingFixture
{
    LoggingFixture()
    {
        auto options = TeeProxy::Logging::Options{};
        options.filterLevel = TeeProxy::Logging::Level::warning;
        TeeProxy::Logging::initialize(options);
    }
};

BOOST_TEST_GLOBAL_FIXTURE(LoggingFixture);

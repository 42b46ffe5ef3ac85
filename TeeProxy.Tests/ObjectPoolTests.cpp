#include <boost/test/unit_test.hpp>
#include <Utility/ObjectPool.hpp>
#include <atomic>
#include <thread>

using TeeProxy::Utility::ObjectPool;

namespace
{
    struct Widget
    {
        bool reusable = false;
        int resets = 0;
        std::atomic<int> borrowers{ 0 };
        std::atomic<int>* destructions = nullptr;

        ~Widget()
        {
            if (destructions != nullptr)
            {
                ++*destructions;
            }
        }

        bool isReusable() const { return reusable; }

        void reset() { ++resets; }
    };

    using WidgetPool = ObjectPool<Widget>;

    std::shared_ptr<WidgetPool> makePool(std::size_t const capacity)
    {
        return WidgetPool::create([] { return std::make_unique<Widget>(); }, capacity);
    }
}

BOOST_AUTO_TEST_SUITE(ObjectPoolTests)

BOOST_AUTO_TEST_CASE(AllocatesWhenEmpty)
{
    auto const pool = makePool(4);
    auto const first = pool->acquire();
    auto const second = pool->acquire();
    BOOST_TEST(first != second);

    auto const statistics = pool->getStatistics();
    BOOST_TEST(statistics.allocated == 2u);
    BOOST_TEST(statistics.reused == 0u);
    BOOST_TEST(statistics.idle == 0u);
}

BOOST_AUTO_TEST_CASE(ReusesReleasedObjects)
{
    auto const pool = makePool(4);
    auto widget = pool->acquire();
    auto const* const address = widget.get();
    widget->reusable = true;
    widget.reset();
    BOOST_TEST(pool->getStatistics().idle == 1u);

    auto const again = pool->acquire();
    BOOST_TEST(again.get() == address);
    BOOST_TEST(again->resets == 1);

    auto const statistics = pool->getStatistics();
    BOOST_TEST(statistics.allocated == 1u);
    BOOST_TEST(statistics.reused == 1u);
    BOOST_TEST(statistics.idle == 0u);
}

BOOST_AUTO_TEST_CASE(DiscardsObjectsStillInUse)
{
    auto const pool = makePool(4);
    auto widget = pool->acquire();
    widget.reset();

    auto const statistics = pool->getStatistics();
    BOOST_TEST(statistics.discarded == 1u);
    BOOST_TEST(statistics.idle == 0u);
}

BOOST_AUTO_TEST_CASE(KeepsAtMostCapacityIdle)
{
    auto const pool = makePool(1);
    auto first = pool->acquire();
    auto second = pool->acquire();
    first->reusable = true;
    second->reusable = true;
    first.reset();
    second.reset();

    auto const statistics = pool->getStatistics();
    BOOST_TEST(statistics.idle == 1u);
    BOOST_TEST(statistics.discarded == 1u);
}

BOOST_AUTO_TEST_CASE(ObjectsMayOutliveThePool)
{
    auto destructions = std::atomic<int>{ 0 };
    auto pool = makePool(4);
    auto widget = pool->acquire();
    widget->reusable = true;
    widget->destructions = &destructions;

    pool.reset();
    BOOST_TEST(destructions.load() == 0);

    widget.reset();
    BOOST_TEST(destructions.load() == 1);
}

BOOST_AUTO_TEST_CASE(ConcurrentBorrowersNeverShare)
{
    constexpr auto threadCount = 8;
    constexpr auto iterations = 1000;

    auto const pool = makePool(threadCount);
    auto shared = std::atomic<bool>{ false };
    auto threads = std::vector<std::thread>{};
    for (auto i = 0; i < threadCount; ++i)
    {
        threads.emplace_back([&pool, &shared]
        {
            for (auto j = 0; j < iterations; ++j)
            {
                auto widget = pool->acquire();
                if (widget->borrowers.fetch_add(1) != 0)
                {
                    shared = true;
                }
                widget->reusable = true;
                widget->borrowers.fetch_sub(1);
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    auto const statistics = pool->getStatistics();
    BOOST_TEST(!shared.load());
    BOOST_TEST(statistics.allocated <= static_cast<std::size_t>(threadCount));
    BOOST_TEST(statistics.allocated + statistics.reused == static_cast<std::size_t>(threadCount * iterations));
    BOOST_TEST(statistics.discarded == 0u);
}

BOOST_AUTO_TEST_SUITE_END()

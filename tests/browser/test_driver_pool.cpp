#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "gradia/browser/driver_pool.hpp"
#include "support/fake_engine.hpp"

using namespace gradia::browser;
using gradia::ErrorCode;
using gradia::testing::FakeEngine;

TEST_CASE("DriverPool leases fresh handles up to the cap", "[pool]") {
    auto engine = std::make_shared<FakeEngine>();
    PoolOptions options;
    options.max_handles = 2;
    options.navigation_timeout = std::chrono::milliseconds(750);
    options.launch.viewport_width = 1280;
    DriverPool pool(engine, options);

    auto a = pool.acquire();
    REQUIRE(a.has_value());
    CHECK(a->valid());
    CHECK(a->navigation_timeout() == std::chrono::milliseconds(750));
    CHECK(engine->last_options().viewport_width == 1280);

    auto b = pool.acquire();
    REQUIRE(b.has_value());
    CHECK(a->id() != b->id());
    CHECK(pool.active_count() == 2);

    SECTION("acquire at capacity fails immediately") {
        auto c = pool.acquire();
        REQUIRE_FALSE(c.has_value());
        CHECK(c.error().code() == ErrorCode::PoolExhausted);
        CHECK(engine->counters().launches.load() == 2);
    }

    SECTION("release destroys the handle and frees the slot") {
        pool.release(*a);
        CHECK_FALSE(a->valid());
        CHECK(pool.active_count() == 1);
        CHECK(engine->counters().destroyed.load() == 1);
        CHECK(engine->counters().closed.load() == 1);

        // A second release of the same lease is a no-op
        pool.release(*a);
        CHECK(pool.active_count() == 1);
        CHECK(engine->counters().destroyed.load() == 1);

        auto c = pool.acquire();
        REQUIRE(c.has_value());
        // Never recycled: a third instance was launched
        CHECK(engine->counters().created.load() == 3);
    }
}

TEST_CASE("Lease releases on scope exit and on move-assign", "[pool]") {
    auto engine = std::make_shared<FakeEngine>();
    DriverPool pool(engine, PoolOptions{1, std::chrono::milliseconds(500), {}});

    {
        auto lease = pool.acquire();
        REQUIRE(lease.has_value());
        CHECK(pool.active_count() == 1);
    }
    CHECK(pool.active_count() == 0);
    CHECK(engine->counters().destroyed.load() == 1);

    auto first = pool.acquire();
    REQUIRE(first.has_value());
    Lease moved = std::move(*first);
    CHECK_FALSE(first->valid());
    CHECK(moved.valid());
    moved = Lease{};
    CHECK(pool.active_count() == 0);
    CHECK(engine->counters().destroyed.load() == 2);
}

TEST_CASE("Launch failure gives the slot back", "[pool]") {
    auto engine = std::make_shared<FakeEngine>();
    engine->fail_launch = true;
    DriverPool pool(engine, PoolOptions{1, std::chrono::milliseconds(500), {}});

    auto lease = pool.acquire();
    REQUIRE_FALSE(lease.has_value());
    CHECK(lease.error().code() == ErrorCode::EngineCrashed);
    CHECK(pool.active_count() == 0);
    CHECK(pool.stats().launch_failures == 1);

    engine->fail_launch = false;
    CHECK(pool.acquire().has_value());
}

TEST_CASE("Throwing launch gives the slot back", "[pool][leak]") {
    auto engine = std::make_shared<FakeEngine>();
    engine->throw_on_launch = true;
    DriverPool pool(engine, PoolOptions{2, std::chrono::milliseconds(500), {}});

    for (int i = 0; i < 3; ++i) {
        auto lease = pool.acquire();
        REQUIRE_FALSE(lease.has_value());
        CHECK(lease.error().code() == ErrorCode::EngineCrashed);
        CHECK(pool.active_count() == 0);
    }
    CHECK(pool.stats().launch_failures == 3);

    engine->throw_on_launch = false;
    auto lease = pool.acquire();
    REQUIRE(lease.has_value());
    lease->release();
    CHECK(pool.active_count() == 0);
    CHECK(engine->counters().created.load() == engine->counters().destroyed.load());
}

TEST_CASE("shutdown_all terminates leased handles and refuses new leases", "[pool]") {
    auto engine = std::make_shared<FakeEngine>();
    DriverPool pool(engine, PoolOptions{3, std::chrono::milliseconds(500), {}});

    auto a = pool.acquire();
    auto b = pool.acquire();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    pool.shutdown_all();
    CHECK(pool.is_closed());
    CHECK(engine->counters().terminated.load() == 2);

    auto c = pool.acquire();
    REQUIRE_FALSE(c.has_value());
    CHECK(c.error().code() == ErrorCode::PoolClosed);

    // Terminated handles still go through release exactly once
    a->release();
    b->release();
    CHECK(pool.active_count() == 0);
    CHECK(engine->counters().created.load() == engine->counters().destroyed.load());
}

TEST_CASE("Concurrent acquirers never exceed the cap", "[pool][concurrency]") {
    auto engine = std::make_shared<FakeEngine>();
    constexpr size_t kCap = 3;
    DriverPool pool(engine, PoolOptions{kCap, std::chrono::milliseconds(500), {}});

    std::atomic<int> leased{0};
    std::atomic<int> rejected{0};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            for (int round = 0; round < 20; ++round) {
                auto lease = pool.acquire();
                if (!lease) {
                    if (lease.error().code() != ErrorCode::PoolExhausted) ++unexpected;
                    ++rejected;
                    continue;
                }
                ++leased;
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(leased.load() > 0);
    CHECK(unexpected.load() == 0);
    CHECK(engine->counters().peak.load() <= static_cast<int>(kCap));
    CHECK(pool.stats().peak_active <= kCap);
    CHECK(pool.active_count() == 0);
    CHECK(engine->counters().created.load() == engine->counters().destroyed.load());
    CHECK(static_cast<int>(pool.stats().created) == leased.load());
}

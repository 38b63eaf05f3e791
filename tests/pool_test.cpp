#include "storage/pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

namespace sluice::storage {

namespace asio = boost::asio;

// ── Fixture ─────────────────────────────────────────────────────────────────

class PoolTest : public ::testing::Test {
protected:
    asio::io_context ioc_;
};

// ── query / execute ─────────────────────────────────────────────────────────

TEST_F(PoolTest, QueryReturnsValueProducedOnWorker) {
    Pool pool(2, 8);
    const auto caller = std::this_thread::get_id();

    std::error_code ec;
    std::string value;
    std::thread::id ran_on;

    auto task = [&]() -> asio::awaitable<void> {
        std::tie(ec, value) = co_await pool.query<std::string>(
            [&](std::string& out) {
                ran_on = std::this_thread::get_id();
                out = "hello";
                return std::error_code{};
            });
    };
    asio::co_spawn(ioc_, task(), asio::detached);
    ioc_.run();

    EXPECT_FALSE(ec);
    EXPECT_EQ(value, "hello");
    EXPECT_NE(ran_on, caller);
}

TEST_F(PoolTest, ExecuteReturnsBodyStatus) {
    Pool pool(1, 4);
    std::error_code ec;

    auto task = [&]() -> asio::awaitable<void> {
        ec = co_await pool.execute([] { return make_error_code(errc::write_error); });
    };
    asio::co_spawn(ioc_, task(), asio::detached);
    ioc_.run();

    EXPECT_EQ(ec, errc::write_error);
}

TEST_F(PoolTest, ThrowingBodyIsReportedAsPoolPanic) {
    Pool pool(1, 4);
    std::error_code first;
    std::error_code second;
    int value = 0;

    auto task = [&]() -> asio::awaitable<void> {
        first = co_await pool.execute([]() -> std::error_code {
            throw std::runtime_error("boom");
        });
        // The same worker keeps serving the queue.
        std::tie(second, value) = co_await pool.query<int>([](int& out) {
            out = 42;
            return std::error_code{};
        });
    };
    asio::co_spawn(ioc_, task(), asio::detached);
    ioc_.run();

    EXPECT_EQ(first, errc::pool_panic);
    EXPECT_FALSE(second);
    EXPECT_EQ(value, 42);
    EXPECT_EQ(pool.stats().panicked, 1u);
}

// ── Backpressure ────────────────────────────────────────────────────────────

TEST_F(PoolTest, CallersBeyondCapacityWaitAndAllComplete) {
    Pool pool(2, 1);
    constexpr int kCallers = 50;
    std::atomic<int> ran{0};
    int ok = 0;

    auto task = [&]() -> asio::awaitable<void> {
        auto ec = co_await pool.execute([&] {
            ran.fetch_add(1);
            return std::error_code{};
        });
        if (!ec) {
            ++ok;
        }
    };
    for (int i = 0; i < kCallers; ++i) {
        asio::co_spawn(ioc_, task(), asio::detached);
    }
    ioc_.run();

    EXPECT_EQ(ran.load(), kCallers);
    EXPECT_EQ(ok, kCallers);

    auto s = pool.stats();
    EXPECT_EQ(s.workers, 2u);
    EXPECT_EQ(s.capacity, 1u);
    EXPECT_EQ(s.queued, 0u);
    EXPECT_EQ(s.waiting, 0u);
    EXPECT_EQ(s.completed, static_cast<uint64_t>(kCallers));
}

// ── Cancellation ────────────────────────────────────────────────────────────

TEST_F(PoolTest, CancelRemovesQueuedDispatch) {
    Pool pool(1, 4);
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    std::error_code blocker_ec;
    std::error_code canceled_ec;
    std::atomic<bool> canceled_ran{false};
    auto ticket = std::make_shared<Pool::Ticket>();

    auto blocker = [&]() -> asio::awaitable<void> {
        blocker_ec = co_await pool.execute([opened] {
            opened.wait();
            return std::error_code{};
        });
    };
    auto victim = [&]() -> asio::awaitable<void> {
        canceled_ec = co_await pool.execute([&] {
            canceled_ran = true;
            return std::error_code{};
        }, ticket);
    };
    asio::co_spawn(ioc_, blocker(), asio::detached);
    asio::co_spawn(ioc_, victim(), asio::detached);

    // Both dispatches are submitted; the first occupies the only worker.
    ioc_.poll();
    pool.cancel(ticket);
    gate.set_value();
    ioc_.run();

    EXPECT_FALSE(blocker_ec);
    EXPECT_TRUE(is_canceled(canceled_ec));
    EXPECT_FALSE(canceled_ran.load());
    EXPECT_TRUE(ticket->canceled());
}

TEST_F(PoolTest, RunningDispatchResultIsDiscardedOnCancel) {
    Pool pool(1, 4);
    std::promise<void> started;
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    auto ticket = std::make_shared<Pool::Ticket>();

    std::error_code ec;
    int value = 0;

    auto task = [&]() -> asio::awaitable<void> {
        std::tie(ec, value) = co_await pool.query<int>([&, opened](int& out) {
            started.set_value();
            opened.wait();
            out = 7;
            return std::error_code{};
        }, ticket);
    };
    asio::co_spawn(ioc_, task(), asio::detached);

    ioc_.poll();
    started.get_future().wait();
    pool.cancel(ticket);
    gate.set_value();
    ioc_.run();

    EXPECT_TRUE(is_canceled(ec));
    EXPECT_EQ(value, 0);
}

// ── Shutdown ────────────────────────────────────────────────────────────────

TEST_F(PoolTest, DispatchAfterShutdownIsCanceled) {
    Pool pool(2, 4);
    pool.shutdown();
    EXPECT_TRUE(pool.stopped());

    std::error_code ec;
    bool ran = false;
    auto task = [&]() -> asio::awaitable<void> {
        ec = co_await pool.execute([&] {
            ran = true;
            return std::error_code{};
        });
    };
    asio::co_spawn(ioc_, task(), asio::detached);
    ioc_.run();

    EXPECT_TRUE(is_canceled(ec));
    EXPECT_FALSE(ran);
}

TEST_F(PoolTest, ShutdownIsIdempotent) {
    Pool pool(2, 4);
    pool.shutdown();
    pool.shutdown();
    EXPECT_TRUE(pool.stopped());
}

} // namespace sluice::storage

#include "db_fixture.hpp"

#include "storage/cork.hpp"
#include "storage/map.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

namespace sluice::storage {

namespace asio = boost::asio;

class CorkTest : public test::DbFixture {
protected:
    void SetUp() override {
        DbFixture::SetUp();
        open({"events", "index"});
        events_ = map("events");
        index_ = map("index");
    }

    void TearDown() override {
        events_.reset();
        index_.reset();
        DbFixture::TearDown();
    }

    std::shared_ptr<Map> events_;
    std::shared_ptr<Map> index_;
};

TEST_F(CorkTest, NothingIsVisibleBeforeCommit) {
    auto cork = events_->cork();
    cork.put(*events_, "e1", "hello");
    EXPECT_EQ(cork.size(), 1u);

    auto [ec, value] = run(events_->get("e1"));
    EXPECT_EQ(ec, errc::not_found);
}

TEST_F(CorkTest, CommitAppliesEveryOperationAcrossMaps) {
    ASSERT_FALSE(run(events_->insert("old", "x")));

    auto cork = events_->cork();
    cork.put(*events_, "e1", "one");
    cork.put(*events_, "e2", "two");
    cork.put(*index_, "room:1:e1", "e1");
    cork.del(*events_, "old");

    EXPECT_FALSE(run(cork.commit()));
    EXPECT_TRUE(cork.committed());

    EXPECT_EQ(std::get<1>(run(events_->get("e1"))), "one");
    EXPECT_EQ(std::get<1>(run(events_->get("e2"))), "two");
    EXPECT_EQ(std::get<1>(run(index_->get("room:1:e1"))), "e1");
    EXPECT_EQ(std::get<0>(run(events_->get("old"))), errc::not_found);
}

TEST_F(CorkTest, LaterOperationOnSameKeyWins) {
    auto cork = events_->cork();
    cork.put(*events_, "k", "first");
    cork.put(*events_, "k", "second");
    cork.del(*events_, "gone");
    EXPECT_FALSE(run(cork.commit()));
    EXPECT_EQ(std::get<1>(run(events_->get("k"))), "second");
}

TEST_F(CorkTest, DroppedCorkIsDiscarded) {
    {
        auto cork = events_->cork();
        cork.put(*events_, "never", "seen");
        cork.put(*index_, "never", "seen");
        EXPECT_EQ(db_->engine().active_corks(), 1u);
    }
    EXPECT_EQ(db_->engine().active_corks(), 0u);

    EXPECT_EQ(std::get<0>(run(events_->get("never"))), errc::not_found);
    EXPECT_EQ(std::get<0>(run(index_->get("never"))), errc::not_found);
}

TEST_F(CorkTest, ActiveCorkCountTracksCommit) {
    auto a = events_->cork();
    auto b = index_->cork();
    EXPECT_EQ(db_->engine().active_corks(), 2u);

    a.put(*events_, "k", "v");
    EXPECT_FALSE(run(a.commit()));
    EXPECT_EQ(db_->engine().active_corks(), 1u);

    // A second commit of a spent cork changes nothing.
    EXPECT_FALSE(run(a.commit()));
    EXPECT_EQ(db_->engine().active_corks(), 1u);
}

TEST_F(CorkTest, CommitNotifiesWatchersOfWrittenKeys) {
    auto on_event = events_->watch("e1");
    auto on_index = index_->watch_prefix("room:1:");
    auto untouched = events_->watch("e2");

    auto cork = events_->cork();
    cork.put(*events_, "e1", "x");
    cork.put(*index_, "room:1:e1", "e1");
    EXPECT_FALSE(on_event->resolved());

    EXPECT_FALSE(run(cork.commit()));
    EXPECT_TRUE(on_event->resolved());
    EXPECT_TRUE(on_index->resolved());
    EXPECT_FALSE(untouched->resolved());
}

TEST_F(CorkTest, DeletingAbsentKeyWakesNobody) {
    ASSERT_FALSE(run(events_->insert("present", "x")));
    auto on_present = events_->watch("present");
    auto on_absent = events_->watch("absent");
    auto on_transient = events_->watch("transient");

    auto cork = events_->cork();
    cork.del(*events_, "present");
    cork.del(*events_, "absent");
    cork.put(*events_, "transient", "t");
    cork.del(*events_, "transient");
    EXPECT_FALSE(run(cork.commit()));

    EXPECT_TRUE(on_present->resolved());
    EXPECT_FALSE(on_absent->resolved());
    EXPECT_TRUE(on_transient->resolved());
    EXPECT_EQ(events_->watches().pending(), 1u);
}

TEST_F(CorkTest, ConcurrentReadersNeverSeeHalfACommit) {
    constexpr std::uint64_t kKeys = 10;
    constexpr int kRounds = 40;

    std::atomic<bool> stop{false};
    std::atomic<int> observed{0};
    std::atomic<int> partial{0};
    std::atomic<int> failed{0};

    // Readers run on their own io_context and thread.
    asio::io_context reader_ioc;
    auto reader = [&]() -> asio::awaitable<void> {
        while (!stop.load()) {
            auto [ec, n] = co_await events_->count_prefix("k");
            if (ec) {
                failed.fetch_add(1);
                co_return;
            }
            observed.fetch_add(1);
            if (n != 0 && n != kKeys) {
                partial.fetch_add(1);
            }
        }
    };
    asio::co_spawn(reader_ioc, reader(), asio::detached);
    asio::co_spawn(reader_ioc, reader(), asio::detached);
    std::thread readers([&] { reader_ioc.run(); });

    auto writer = [&]() -> asio::awaitable<void> {
        for (int round = 0; round < kRounds; ++round) {
            auto cork = events_->cork();
            for (std::uint64_t i = 0; i < kKeys; ++i) {
                auto key = "k" + std::to_string(i);
                if (round % 2 == 0) {
                    cork.put(*events_, key, "v");
                } else {
                    cork.del(*events_, key);
                }
            }
            EXPECT_FALSE(co_await cork.commit());
        }
    };
    run(writer());

    while (observed.load() < 2 && failed.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    stop.store(true);
    readers.join();

    EXPECT_EQ(failed.load(), 0);
    EXPECT_GT(observed.load(), 0);
    EXPECT_EQ(partial.load(), 0);
}

TEST_F(CorkTest, WritingToSpentCorkThrows) {
    auto cork = events_->cork();
    cork.put(*events_, "k", "v");
    ASSERT_FALSE(run(cork.commit()));
    EXPECT_THROW(cork.put(*events_, "k2", "v"), std::logic_error);
    EXPECT_THROW(cork.del(*events_, "k"), std::logic_error);
}

TEST_F(CorkTest, MovedCorkKeepsItsOperations) {
    auto cork = events_->cork();
    cork.put(*events_, "moved", "yes");
    Cork taken(std::move(cork));
    EXPECT_EQ(db_->engine().active_corks(), 1u);

    EXPECT_FALSE(run(taken.commit()));
    EXPECT_EQ(std::get<1>(run(events_->get("moved"))), "yes");
    EXPECT_EQ(db_->engine().active_corks(), 0u);
}

TEST_F(CorkTest, CommitOnReadOnlyDatabaseFailsWithWriteError) {
    events_.reset();
    index_.reset();
    db_.reset();

    cfg_.read_only = true;
    open({"events", "index"});
    auto events = map("events");

    auto cork = events->cork();
    cork.put(*events, "k", "v");
    EXPECT_EQ(run(cork.commit()), errc::write_error);
    EXPECT_FALSE(cork.committed());
    EXPECT_EQ(std::get<0>(run(events->get("k"))), errc::not_found);
}

} // namespace sluice::storage

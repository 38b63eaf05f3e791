#include "db_fixture.hpp"

#include "storage/map.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

namespace sluice::storage {

class MapTest : public test::DbFixture {
protected:
    void SetUp() override {
        DbFixture::SetUp();
        open({"users", "other"});
        users_ = map("users");
    }

    void TearDown() override {
        users_.reset();
        DbFixture::TearDown();
    }

    std::error_code put(const std::string& k, const std::string& v) {
        return run(users_->insert(k, v));
    }

    std::shared_ptr<Map> users_;
};

// ── get() ─────────────────────────────────────────────────────────────────────

TEST_F(MapTest, GetMissingKeyIsNotFound) {
    auto [ec, value] = run(users_->get("nonexistent"));
    EXPECT_EQ(ec, errc::not_found);
    EXPECT_TRUE(value.empty());
}

TEST_F(MapTest, InsertThenGetReturnsValue) {
    ASSERT_FALSE(put("alice", "1"));
    auto [ec, value] = run(users_->get("alice"));
    EXPECT_FALSE(ec);
    EXPECT_EQ(value, "1");
}

TEST_F(MapTest, InsertOverwritesExistingKey) {
    ASSERT_FALSE(put("key", "first"));
    ASSERT_FALSE(put("key", "second"));
    auto [ec, value] = run(users_->get("key"));
    EXPECT_FALSE(ec);
    EXPECT_EQ(value, "second");
}

TEST_F(MapTest, HandlesEmptyValueAndBinaryKey) {
    const std::string key("\x00\xff\x01", 3);
    ASSERT_FALSE(put(key, ""));
    auto [ec, value] = run(users_->get(key));
    EXPECT_FALSE(ec);
    EXPECT_EQ(value, "");
}

TEST_F(MapTest, KeyspacesAreIndependent) {
    ASSERT_FALSE(put("shared", "users"));
    auto other = map("other");
    auto [ec, value] = run(other->get("shared"));
    EXPECT_EQ(ec, errc::not_found);
}

// ── remove() ──────────────────────────────────────────────────────────────────

TEST_F(MapTest, RemoveDeletesKey) {
    ASSERT_FALSE(put("gone", "x"));
    EXPECT_FALSE(run(users_->remove("gone")));
    auto [ec, value] = run(users_->get("gone"));
    EXPECT_EQ(ec, errc::not_found);
}

TEST_F(MapTest, RemoveAbsentKeyIsNoOp) {
    EXPECT_FALSE(run(users_->remove("never-there")));
    auto [ec, n] = run(users_->count());
    EXPECT_FALSE(ec);
    EXPECT_EQ(n, 0u);
}

TEST_F(MapTest, PutAndDelAreAliases) {
    EXPECT_FALSE(run(users_->put("k", "v")));
    auto [ec, found] = run(users_->contains("k"));
    EXPECT_FALSE(ec);
    EXPECT_TRUE(found);

    EXPECT_FALSE(run(users_->del("k")));
    auto [ec2, found2] = run(users_->contains("k"));
    EXPECT_FALSE(ec2);
    EXPECT_FALSE(found2);
}

// ── contains() / count() ──────────────────────────────────────────────────────

TEST_F(MapTest, ContainsReportsPresence) {
    ASSERT_FALSE(put("here", "1"));
    EXPECT_TRUE(std::get<1>(run(users_->contains("here"))));
    EXPECT_FALSE(std::get<1>(run(users_->contains("absent"))));
}

TEST_F(MapTest, CountReflectsLiveKeys) {
    for (int i = 0; i < 10; ++i) {
        ASSERT_FALSE(put("k" + std::to_string(i), "v"));
    }
    ASSERT_FALSE(run(users_->remove("k3")));

    auto [ec, n] = run(users_->count());
    EXPECT_FALSE(ec);
    EXPECT_EQ(n, 9u);
}

TEST_F(MapTest, CountPrefixCountsOnlyMatchingKeys) {
    ASSERT_FALSE(put("room:1:a", "x"));
    ASSERT_FALSE(put("room:1:b", "x"));
    ASSERT_FALSE(put("room:10", "x"));
    ASSERT_FALSE(put("room:2:a", "x"));
    ASSERT_FALSE(put("user:1", "x"));

    EXPECT_EQ(std::get<1>(run(users_->count_prefix("room:1:"))), 2u);
    EXPECT_EQ(std::get<1>(run(users_->count_prefix("room:1"))), 3u);
    EXPECT_EQ(std::get<1>(run(users_->count_prefix("room:"))), 4u);
    EXPECT_EQ(std::get<1>(run(users_->count_prefix("zzz"))), 0u);
}

// ── get_batch() ───────────────────────────────────────────────────────────────

TEST_F(MapTest, GetBatchReturnsPerKeyResults) {
    ASSERT_FALSE(put("a", "1"));
    ASSERT_FALSE(put("c", "3"));

    auto [ec, values] = run(users_->get_batch({"a", "b", "c"}));
    EXPECT_FALSE(ec);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], std::optional<std::string>("1"));
    EXPECT_EQ(values[1], std::nullopt);
    EXPECT_EQ(values[2], std::optional<std::string>("3"));
}

TEST_F(MapTest, GetBatchOfNothingIsEmpty) {
    auto [ec, values] = run(users_->get_batch({}));
    EXPECT_FALSE(ec);
    EXPECT_TRUE(values.empty());
}

// ── clear() / compact() ───────────────────────────────────────────────────────

TEST_F(MapTest, ClearRemovesEveryKeyOfThisMapOnly) {
    ASSERT_FALSE(put("a", "1"));
    ASSERT_FALSE(put("b", "2"));
    auto other = map("other");
    ASSERT_FALSE(run(other->insert("a", "kept")));

    EXPECT_FALSE(run(users_->clear()));

    EXPECT_EQ(std::get<1>(run(users_->count())), 0u);
    auto [ec, value] = run(other->get("a"));
    EXPECT_FALSE(ec);
    EXPECT_EQ(value, "kept");
}

TEST_F(MapTest, CompactKeepsData) {
    for (int i = 0; i < 100; ++i) {
        ASSERT_FALSE(put("k" + std::to_string(i), std::string(64, 'x')));
    }
    EXPECT_FALSE(run(users_->compact()));
    EXPECT_EQ(std::get<1>(run(users_->count())), 100u);
}

// ── Persistence ───────────────────────────────────────────────────────────────

TEST_F(MapTest, DataSurvivesReopen) {
    ASSERT_FALSE(put("durable", "yes"));
    users_.reset();
    open({"users", "other"});
    users_ = map("users");

    auto [ec, value] = run(users_->get("durable"));
    EXPECT_FALSE(ec);
    EXPECT_EQ(value, "yes");
}

// ── Introspection ────────────────────────────────────────────────────

TEST_F(MapTest, PropertiesPassThroughToEngine) {
    ASSERT_FALSE(put("a", "1"));
    EXPECT_TRUE(users_->property_integer("rocksdb.estimate-num-keys").has_value());
    EXPECT_TRUE(users_->property("rocksdb.stats").has_value());
    EXPECT_FALSE(users_->property("rocksdb.no-such-property").has_value());
    EXPECT_EQ(users_->name(), "users");
}

} // namespace sluice::storage

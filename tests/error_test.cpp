#include "common/error.hpp"
#include "storage/status.hpp"

#include <rocksdb/status.h>

#include <gtest/gtest.h>

#include <system_error>

namespace sluice {

// ── errc / category ─────────────────────────────────────────────────────────

TEST(ErrorTest, ErrcConvertsToErrorCode) {
    std::error_code ec = errc::not_found;
    EXPECT_TRUE(ec);
    EXPECT_EQ(&ec.category(), &storage_category());
    EXPECT_EQ(ec, errc::not_found);
    EXPECT_NE(ec, errc::io_error);
}

TEST(ErrorTest, EveryKindHasAMessage) {
    for (auto e : {errc::open_error, errc::not_found, errc::io_error,
                   errc::pool_panic, errc::write_error}) {
        EXPECT_FALSE(make_error_code(e).message().empty());
        EXPECT_NE(make_error_code(e).message(), "unknown storage error");
    }
    EXPECT_STREQ(storage_category().name(), "sluice.storage");
}

TEST(ErrorTest, IsCanceledRecognisesOperationCanceled) {
    EXPECT_TRUE(is_canceled(std::make_error_code(std::errc::operation_canceled)));
    EXPECT_FALSE(is_canceled(make_error_code(errc::io_error)));
    EXPECT_FALSE(is_canceled(std::error_code{}));
}

// ── to_error_code ───────────────────────────────────────────────────────────

namespace storage {

TEST(StatusTest, OkIsSuccess) {
    EXPECT_FALSE(to_error_code(rocksdb::Status::OK(), Access::Read));
    EXPECT_FALSE(to_error_code(rocksdb::Status::OK(), Access::Write));
}

TEST(StatusTest, NotFoundMapsToNotFound) {
    EXPECT_EQ(to_error_code(rocksdb::Status::NotFound(), Access::Read), errc::not_found);
}

TEST(StatusTest, RejectedWritesMapToWriteError) {
    EXPECT_EQ(to_error_code(rocksdb::Status::NoSpace(), Access::Write), errc::write_error);
    EXPECT_EQ(to_error_code(rocksdb::Status::Busy(), Access::Write), errc::write_error);
    EXPECT_EQ(to_error_code(rocksdb::Status::NotSupported(), Access::Write), errc::write_error);
    EXPECT_EQ(to_error_code(rocksdb::Status::InvalidArgument(), Access::Write), errc::write_error);
}

TEST(StatusTest, OtherFailuresMapToIoError) {
    EXPECT_EQ(to_error_code(rocksdb::Status::IOError(), Access::Write), errc::io_error);
    EXPECT_EQ(to_error_code(rocksdb::Status::Corruption(), Access::Read), errc::io_error);
    EXPECT_EQ(to_error_code(rocksdb::Status::Busy(), Access::Read), errc::io_error);
}

} // namespace storage
} // namespace sluice

#pragma once

#include "common/error.hpp"

#include <system_error>

namespace rocksdb {
class Status;
} // namespace rocksdb

namespace sluice::storage {

// Which side of the engine produced a Status; decides how a rejection is
// classified.
enum class Access {
    Read,
    Write,
};

// Map a RocksDB Status to the storage error taxonomy.
//   ok                    -> success
//   NotFound              -> errc::not_found
//   rejected write        -> errc::write_error (NoSpace, Busy, TimedOut,
//                            Aborted, TryAgain, NotSupported, InvalidArgument)
//   anything else         -> errc::io_error
[[nodiscard]] std::error_code to_error_code(const rocksdb::Status& status, Access access);

} // namespace sluice::storage

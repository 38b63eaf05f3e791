#pragma once

#include "cli/command.hpp"

#include <ostream>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace sluice::storage {
class Database;
}

namespace sluice::cli {

// Run one parsed command against `db`, writing its output to `out`.
// Returns the process exit code: 0 on success, 1 on failure or, for WATCH,
// when the watched key did not change.
boost::asio::awaitable<int> execute(storage::Database& db, Command cmd, std::ostream& out);

} // namespace sluice::cli

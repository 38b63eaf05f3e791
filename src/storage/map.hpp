#pragma once

#include "storage/cork.hpp"
#include "storage/engine.hpp"
#include "storage/stream.hpp"
#include "storage/watch.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <rocksdb/options.h>

namespace sluice::storage {

// ── Map ──────────────────────────────────────────────────────────────────────
//
// Handle to one keyspace (column family).  Every engine call is dispatched
// to the Engine's Pool; nothing blocks the calling coroutine's thread.
//
// Point reads return {error, value}.  A missing key is errc::not_found.
// Writes notify the key's watchers once the engine has applied them.
//
// Thread-safe.  Created by Database::open and shared with every Stream
// opened on it.

class Map : public std::enable_shared_from_this<Map> {
public:
    // Binds to an opened column.  Throws std::system_error(errc::not_found)
    // when the engine has no column called `name`.
    [[nodiscard]] static std::shared_ptr<Map> open(std::shared_ptr<Engine> engine,
                                                   std::string_view name);

    [[nodiscard]] static std::shared_ptr<Map> open(std::shared_ptr<Engine> engine,
                                                   std::string_view name,
                                                   std::error_code& ec);

    Map(const Map&)            = delete;
    Map& operator=(const Map&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // ── Point reads ──────────────────────────────────────────────────────────

    boost::asio::awaitable<std::tuple<std::error_code, std::string>> get(std::string key);

    boost::asio::awaitable<std::tuple<std::error_code, bool>> contains(std::string key);

    // One MultiGet for all `keys`.  A missing key yields std::nullopt in its
    // slot; any other failure fails the whole call.
    boost::asio::awaitable<std::tuple<std::error_code, std::vector<std::optional<std::string>>>>
    get_batch(std::vector<std::string> keys);

    // Number of live keys; walks the column.
    boost::asio::awaitable<std::tuple<std::error_code, uint64_t>> count();
    boost::asio::awaitable<std::tuple<std::error_code, uint64_t>> count_prefix(std::string prefix);

    // ── Writes ───────────────────────────────────────────────────────────────

    boost::asio::awaitable<std::error_code> insert(std::string key, std::string value);

    // Removing an absent key is a no-op and notifies nobody.
    boost::asio::awaitable<std::error_code> remove(std::string key);

    boost::asio::awaitable<std::error_code> put(std::string key, std::string value) {
        return insert(std::move(key), std::move(value));
    }
    boost::asio::awaitable<std::error_code> del(std::string key) {
        return remove(std::move(key));
    }

    // Removes every key in one atomic batch.
    boost::asio::awaitable<std::error_code> clear();

    // Manual compaction of the whole column.
    boost::asio::awaitable<std::error_code> compact();

    // ── Streams ──────────────────────────────────────────────────────────────

    [[nodiscard]] Items entries();
    [[nodiscard]] Items entries_from(std::string key);
    [[nodiscard]] Items entries_prefix(std::string prefix);

    [[nodiscard]] ItemsRev entries_rev();
    [[nodiscard]] ItemsRev entries_rev_from(std::string key);
    [[nodiscard]] ItemsRev entries_rev_prefix(std::string prefix);

    [[nodiscard]] Keys keys();
    [[nodiscard]] Keys keys_from(std::string key);
    [[nodiscard]] Keys keys_prefix(std::string prefix);

    [[nodiscard]] KeysRev keys_rev();
    [[nodiscard]] KeysRev keys_rev_from(std::string key);
    [[nodiscard]] KeysRev keys_rev_prefix(std::string prefix);

    // ── Watch / Cork ─────────────────────────────────────────────────────────

    [[nodiscard]] std::shared_ptr<Watch::Waiter> watch(std::string_view key) {
        return watch_.watch(key);
    }
    [[nodiscard]] std::shared_ptr<Watch::Waiter> watch_prefix(std::string_view prefix) {
        return watch_.watch_prefix(prefix);
    }

    [[nodiscard]] Watch& watches() noexcept { return watch_; }

    // A new batch bound to this Map's engine.
    [[nodiscard]] Cork cork() { return Cork(engine_); }

    // ── Introspection ────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<std::string> property(std::string_view name) const;
    [[nodiscard]] std::optional<uint64_t> property_integer(std::string_view name) const;

    [[nodiscard]] rocksdb::ColumnFamilyHandle* column() const noexcept { return column_; }
    [[nodiscard]] Engine& engine() const noexcept { return *engine_; }

private:
    Map(std::shared_ptr<Engine> engine, std::string name, rocksdb::ColumnFamilyHandle* column);

    template <typename S>
    S stream(Bound bound);

    std::shared_ptr<Engine> engine_;
    const std::string name_;
    rocksdb::ColumnFamilyHandle* column_;

    const rocksdb::ReadOptions read_options_;
    const rocksdb::ReadOptions iter_options_;
    const rocksdb::WriteOptions write_options_;

    Watch watch_;
};

} // namespace sluice::storage

#pragma once

#include "common/db_config.hpp"
#include "storage/descriptor.hpp"
#include "storage/pool.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace rocksdb {
class Cache;
class ColumnFamilyHandle;
class DB;
} // namespace rocksdb

namespace sluice::storage {

// Metadata of one live table file, for observability.
struct FileInfo {
    std::string column;
    int         level = 0;
    std::string name;
    uint64_t    size = 0;
    uint64_t    entries = 0;
    uint64_t    deletions = 0;
};

// ── Engine ───────────────────────────────────────────────────────────────────
//
// Owns the RocksDB instance, its column family handles and the Pool that
// runs every blocking call.  Lives as long as the Database and every Map or
// Stream that still references it.
//
// Modes:
//   read-write  – default; columns are created and dropped to match the
//                 descriptors.
//   read-only   – no writes are accepted; missing columns fail the open.
//   secondary   – read replica following a running primary; catch_up()
//                 replays the primary's newer writes.
//
// Thread-safe.

class Engine {
public:
    // Opens (or creates) the database described by `cfg`.
    // Throws std::system_error carrying errc::open_error on corruption,
    // incompatible on-disk version, permission or I/O failure.
    [[nodiscard]] static std::shared_ptr<Engine> open(
        const DbConfig& cfg, const std::vector<Descriptor>& desc);

    // Non-throwing overload: returns nullptr and sets `ec`.
    [[nodiscard]] static std::shared_ptr<Engine> open(
        const DbConfig& cfg, const std::vector<Descriptor>& desc, std::error_code& ec);

    ~Engine();

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] rocksdb::DB& db() const noexcept { return *db_; }

    [[nodiscard]] Pool& pool() noexcept { return *pool_; }

    [[nodiscard]] const DbConfig& config() const noexcept { return config_; }

    // Handle for an opened, described column; nullptr if there is none.
    [[nodiscard]] rocksdb::ColumnFamilyHandle* column(std::string_view name) const;

    // Names of every opened column (described and undescribed), sorted.
    [[nodiscard]] std::vector<std::string> columns() const;

    [[nodiscard]] bool is_read_only() const noexcept { return config_.read_only; }
    [[nodiscard]] bool is_secondary() const noexcept { return config_.secondary; }

    // Engine introspection, e.g. "rocksdb.stats" or "rocksdb.estimate-num-keys".
    // std::nullopt when the engine does not know the property.
    [[nodiscard]] std::optional<std::string> property(
        rocksdb::ColumnFamilyHandle* cf, std::string_view name) const;
    [[nodiscard]] std::optional<uint64_t> property_integer(
        rocksdb::ColumnFamilyHandle* cf, std::string_view name) const;

    // Live table files across all columns.
    [[nodiscard]] std::vector<FileInfo> file_list() const;

    // Flush every column's memtable to table files.
    boost::asio::awaitable<std::error_code> flush();

    // Persist the write-ahead log.
    boost::asio::awaitable<std::error_code> sync();

    // Secondary mode: replay writes the primary made since the last call.
    boost::asio::awaitable<std::error_code> catch_up();

    // Number of Corks created and not yet committed or discarded.
    [[nodiscard]] uint32_t active_corks() const noexcept {
        return corks_.load(std::memory_order_relaxed);
    }
    void cork_opened() noexcept { corks_.fetch_add(1, std::memory_order_relaxed); }
    void cork_closed() noexcept { corks_.fetch_sub(1, std::memory_order_relaxed); }

    // Stop the Pool: queued dispatches complete with operation_canceled and
    // every later one does too.  The RocksDB handle stays open until the
    // Engine is destroyed.  Idempotent.
    void close();

private:
    Engine(DbConfig cfg, std::shared_ptr<rocksdb::Cache> cache);

    void open_db(const std::vector<Descriptor>& desc);

    DbConfig config_;
    std::shared_ptr<rocksdb::Cache> cache_;
    std::unique_ptr<rocksdb::DB> db_;
    std::map<std::string, rocksdb::ColumnFamilyHandle*, std::less<>> handles_;
    std::unique_ptr<Pool> pool_;   // destroyed before db_
    std::atomic<uint32_t> corks_{0};
};

} // namespace sluice::storage

#include "storage/engine.hpp"

#include "common/logger.hpp"
#include "storage/options.hpp"
#include "storage/status.hpp"

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/metadata.h>
#include <rocksdb/options.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <stdexcept>

namespace sluice::storage {

namespace {

constexpr const char* kDefaultColumn = "default";

[[noreturn]] void throw_open_error(const std::string& what) {
    spdlog::error("{}", what);
    throw std::system_error(make_error_code(errc::open_error), what);
}

bool is_described(const std::vector<Descriptor>& desc, const std::string& name) {
    return std::any_of(desc.begin(), desc.end(),
                       [&](const Descriptor& d) { return d.name == name; });
}

} // anonymous namespace

Engine::Engine(DbConfig cfg, std::shared_ptr<rocksdb::Cache> cache)
    : config_(std::move(cfg))
    , cache_(std::move(cache))
{}

std::shared_ptr<Engine> Engine::open(const DbConfig& cfg,
                                     const std::vector<Descriptor>& desc) {
    auto cache = rocksdb::NewLRUCache(
        static_cast<std::size_t>(cfg.cache_capacity_mb) * 1024 * 1024);

    std::shared_ptr<Engine> engine(new Engine(cfg, std::move(cache)));
    engine->open_db(desc);

    engine->pool_ = std::make_unique<Pool>(
        pool_worker_count(cfg), pool_queue_size(cfg),
        make_logger("pool", spdlog::get_level()));
    spdlog::info("Storage pool ready: {} workers, queue capacity {}",
                 pool_worker_count(cfg), pool_queue_size(cfg));
    return engine;
}

std::shared_ptr<Engine> Engine::open(const DbConfig& cfg,
                                     const std::vector<Descriptor>& desc,
                                     std::error_code& ec) {
    ec.clear();
    try {
        return open(cfg, desc);
    } catch (const std::system_error& e) {
        ec = e.code();
    } catch (const std::exception& e) {
        spdlog::error("Engine open failed: {}", e.what());
        ec = make_error_code(errc::open_error);
    }
    return nullptr;
}

void Engine::open_db(const std::vector<Descriptor>& desc) {
    namespace fs = std::filesystem;
    const auto& path = config_.path;
    const bool writable = !config_.read_only && !config_.secondary;

    if (writable) {
        std::error_code fs_ec;
        fs::create_directories(path, fs_ec);
        if (fs_ec) {
            throw_open_error("Failed to create database directory " + path + ": " +
                             fs_ec.message());
        }
    }

    rocksdb::Options db_opts = db_options(config_);

    if (config_.repair) {
        spdlog::warn("Repairing database at {} ...", path);
        auto status = rocksdb::RepairDB(path, db_opts);
        if (!status.ok()) {
            throw_open_error("Failed to repair database at " + path + ": " +
                             status.ToString());
        }
    }

    // Columns already on disk.  A fresh database has none.
    std::set<std::string> existing;
    {
        std::vector<std::string> names;
        auto status = rocksdb::DB::ListColumnFamilies(db_opts, path, &names);
        if (status.ok()) {
            existing.insert(names.begin(), names.end());
        }
    }

    std::vector<std::string> dropping;
    std::vector<rocksdb::ColumnFamilyDescriptor> cfds;
    std::set<std::string> opening;

    auto add = [&](const Descriptor& d) {
        if (opening.insert(d.name).second) {
            cfds.emplace_back(d.name, cf_options(config_, d, cache_));
        }
    };

    for (const auto& d : desc) {
        const bool found = existing.contains(d.name);
        if (!d.dropped) {
            if (!found) {
                spdlog::debug("Column '{}' is new; creating it", d.name);
            }
            add(d);
        } else if (found) {
            if (writable && !config_.never_drop_columns) {
                spdlog::warn("Dropping column '{}'; its files are reclaimed by later compactions",
                             d.name);
                dropping.push_back(d.name);
            }
            add(d);
        } else {
            spdlog::debug("Column '{}' is already gone", d.name);
        }
    }

    // RocksDB refuses a writable open unless every existing column is listed.
    for (const auto& name : existing) {
        if (name != kDefaultColumn && !is_described(desc, name)) {
            spdlog::warn("Column '{}' exists on disk but has no descriptor; opening it without a map",
                         name);
        }
        add(Descriptor{.name = name});
    }
    add(Descriptor{.name = kDefaultColumn});

    spdlog::debug("Column discovery: on_disk={} described={} opening={} dropping={}",
                  existing.size(), desc.size(), cfds.size(), dropping.size());

    const auto load_start = std::chrono::steady_clock::now();

    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    rocksdb::DB* raw_db = nullptr;
    rocksdb::Status status;
    if (config_.read_only) {
        status = rocksdb::DB::OpenForReadOnly(db_opts, path, cfds, &handles, &raw_db);
    } else if (config_.secondary) {
        status = rocksdb::DB::OpenAsSecondary(db_opts, path, config_.secondary_path,
                                              cfds, &handles, &raw_db);
    } else {
        status = rocksdb::DB::Open(db_opts, path, cfds, &handles, &raw_db);
    }
    if (!status.ok()) {
        throw_open_error("Failed to open RocksDB at " + path + ": " + status.ToString());
    }
    db_.reset(raw_db);

    for (auto* handle : handles) {
        handles_.emplace(handle->GetName(), handle);
    }

    for (const auto& name : dropping) {
        auto it = handles_.find(name);
        if (it == handles_.end()) {
            continue;
        }
        spdlog::debug("DropColumnFamily '{}'", name);
        auto drop_status = db_->DropColumnFamily(it->second);
        if (!drop_status.ok()) {
            throw_open_error("Failed to drop column '" + name + "': " + drop_status.ToString());
        }
        db_->DestroyColumnFamilyHandle(it->second);
        handles_.erase(it);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - load_start);
    spdlog::info("Opened database at {}: columns={} sequence={} mode={} time={}ms",
                 path, handles_.size(), db_->GetLatestSequenceNumber(),
                 config_.read_only ? "read-only" : config_.secondary ? "secondary" : "read-write",
                 elapsed.count());
}

Engine::~Engine() {
    close();
    if (db_) {
        for (auto& [name, handle] : handles_) {
            db_->DestroyColumnFamilyHandle(handle);
        }
        handles_.clear();

        auto status = db_->Close();
        if (!status.ok()) {
            spdlog::error("Closing RocksDB failed: {}", status.ToString());
        } else {
            spdlog::info("Closed database at {}", config_.path);
        }
    }
}

void Engine::close() {
    if (pool_) {
        pool_->shutdown();
    }
}

rocksdb::ColumnFamilyHandle* Engine::column(std::string_view name) const {
    auto it = handles_.find(name);
    return it == handles_.end() ? nullptr : it->second;
}

std::vector<std::string> Engine::columns() const {
    std::vector<std::string> result;
    result.reserve(handles_.size());
    for (const auto& [name, _] : handles_) {
        result.push_back(name);
    }
    return result;
}

std::optional<std::string> Engine::property(rocksdb::ColumnFamilyHandle* cf,
                                            std::string_view name) const {
    std::string value;
    if (!db_->GetProperty(cf, rocksdb::Slice{name.data(), name.size()}, &value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> Engine::property_integer(rocksdb::ColumnFamilyHandle* cf,
                                                 std::string_view name) const {
    uint64_t value = 0;
    if (!db_->GetIntProperty(cf, rocksdb::Slice{name.data(), name.size()}, &value)) {
        return std::nullopt;
    }
    return value;
}

std::vector<FileInfo> Engine::file_list() const {
    std::vector<rocksdb::LiveFileMetaData> live;
    db_->GetLiveFilesMetaData(&live);

    std::vector<FileInfo> files;
    files.reserve(live.size());
    for (const auto& f : live) {
        files.push_back(FileInfo{
            .column    = f.column_family_name,
            .level     = f.level,
            .name      = f.name,
            .size      = f.size,
            .entries   = f.num_entries,
            .deletions = f.num_deletions,
        });
    }
    std::sort(files.begin(), files.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    return files;
}

boost::asio::awaitable<std::error_code> Engine::flush() {
    co_return co_await pool_->execute([this]() -> std::error_code {
        std::vector<rocksdb::ColumnFamilyHandle*> cfs;
        for (const auto& [_, handle] : handles_) {
            cfs.push_back(handle);
        }
        auto status = db_->Flush(rocksdb::FlushOptions{}, cfs);
        if (!status.ok()) {
            spdlog::error("RocksDB Flush failed: {}", status.ToString());
        }
        return to_error_code(status, Access::Write);
    });
}

boost::asio::awaitable<std::error_code> Engine::sync() {
    co_return co_await pool_->execute([this]() -> std::error_code {
        auto status = db_->FlushWAL(/*sync=*/true);
        if (!status.ok()) {
            spdlog::error("RocksDB FlushWAL failed: {}", status.ToString());
        }
        return to_error_code(status, Access::Write);
    });
}

boost::asio::awaitable<std::error_code> Engine::catch_up() {
    if (!config_.secondary) {
        co_return make_error_code(errc::write_error);
    }
    co_return co_await pool_->execute([this]() -> std::error_code {
        auto status = db_->TryCatchUpWithPrimary();
        if (!status.ok()) {
            spdlog::warn("Secondary catch-up failed: {}", status.ToString());
        }
        return to_error_code(status, Access::Read);
    });
}

} // namespace sluice::storage

#include "storage/map.hpp"

#include "storage/options.hpp"
#include "storage/status.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/write_batch.h>

#include <spdlog/spdlog.h>

namespace sluice::storage {

using boost::asio::awaitable;

namespace {

rocksdb::Slice to_slice(std::string_view s) {
    return rocksdb::Slice{s.data(), s.size()};
}

} // anonymous namespace

Map::Map(std::shared_ptr<Engine> engine, std::string name, rocksdb::ColumnFamilyHandle* column)
    : engine_(std::move(engine))
    , name_(std::move(name))
    , column_(column)
    , read_options_(read_options_default(engine_->config()))
    , iter_options_(iter_options_default(engine_->config()))
    , write_options_(write_options_default(engine_->config()))
{}

std::shared_ptr<Map> Map::open(std::shared_ptr<Engine> engine, std::string_view name) {
    std::error_code ec;
    auto map = open(std::move(engine), name, ec);
    if (ec) {
        throw std::system_error(ec, "column '" + std::string(name) + "'");
    }
    return map;
}

std::shared_ptr<Map> Map::open(std::shared_ptr<Engine> engine, std::string_view name,
                               std::error_code& ec) {
    ec.clear();
    auto* column = engine->column(name);
    if (!column) {
        spdlog::warn("No column '{}' in database {}", name, engine->config().path);
        ec = make_error_code(errc::not_found);
        return nullptr;
    }
    return std::shared_ptr<Map>(new Map(std::move(engine), std::string(name), column));
}

// ── Point reads ──────────────────────────────────────────────────────────────

awaitable<std::tuple<std::error_code, std::string>> Map::get(std::string key) {
    co_return co_await engine_->pool().query<std::string>(
        [this, &key](std::string& value) {
            auto status = engine_->db().Get(read_options_, column_, to_slice(key), &value);
            if (!status.ok() && !status.IsNotFound()) {
                spdlog::error("RocksDB Get failed on '{}': {}", name_, status.ToString());
            }
            return to_error_code(status, Access::Read);
        });
}

awaitable<std::tuple<std::error_code, bool>> Map::contains(std::string key) {
    co_return co_await engine_->pool().query<bool>(
        [this, &key](bool& found) {
            rocksdb::PinnableSlice value;
            auto status = engine_->db().Get(read_options_, column_, to_slice(key), &value);
            found = status.ok();
            if (status.ok() || status.IsNotFound()) {
                return std::error_code{};
            }
            spdlog::error("RocksDB Get failed on '{}': {}", name_, status.ToString());
            return to_error_code(status, Access::Read);
        });
}

awaitable<std::tuple<std::error_code, std::vector<std::optional<std::string>>>>
Map::get_batch(std::vector<std::string> keys) {
    using Values = std::vector<std::optional<std::string>>;
    co_return co_await engine_->pool().query<Values>(
        [this, &keys](Values& out) -> std::error_code {
            std::vector<rocksdb::Slice> slices;
            slices.reserve(keys.size());
            for (const auto& k : keys) {
                slices.push_back(to_slice(k));
            }
            std::vector<rocksdb::ColumnFamilyHandle*> columns(keys.size(), column_);
            std::vector<std::string> values;

            auto statuses = engine_->db().MultiGet(read_options_, columns, slices, &values);

            out.assign(keys.size(), std::nullopt);
            for (std::size_t i = 0; i < statuses.size(); ++i) {
                if (statuses[i].ok()) {
                    out[i] = std::move(values[i]);
                } else if (!statuses[i].IsNotFound()) {
                    spdlog::error("RocksDB MultiGet failed on '{}': {}",
                                  name_, statuses[i].ToString());
                    return to_error_code(statuses[i], Access::Read);
                }
            }
            return {};
        });
}

awaitable<std::tuple<std::error_code, uint64_t>> Map::count() {
    co_return co_await count_prefix({});
}

awaitable<std::tuple<std::error_code, uint64_t>> Map::count_prefix(std::string prefix) {
    co_return co_await engine_->pool().query<uint64_t>(
        [this, &prefix](uint64_t& n) {
            State state(engine_->db(), column_, iter_options_, Direction::Forward,
                        Bound::prefix(prefix));
            std::error_code ec;
            for (ec = state.advance(); !ec && state.valid(); ec = state.advance()) {
                ++n;
            }
            return ec;
        });
}

// ── Writes ───────────────────────────────────────────────────────────────────

awaitable<std::error_code> Map::insert(std::string key, std::string value) {
    co_return co_await engine_->pool().execute(
        [this, &key, &value]() {
            auto status = engine_->db().Put(write_options_, column_,
                                            to_slice(key), to_slice(value));
            if (!status.ok()) {
                spdlog::error("RocksDB Put failed on '{}': {}", name_, status.ToString());
                return to_error_code(status, Access::Write);
            }
            watch_.notify(key);
            return std::error_code{};
        });
}

awaitable<std::error_code> Map::remove(std::string key) {
    co_return co_await engine_->pool().execute(
        [this, &key]() {
            // RocksDB Delete succeeds on a missing key; check first so an
            // absent key wakes nobody.
            rocksdb::PinnableSlice existing;
            auto get_status = engine_->db().Get(read_options_, column_, to_slice(key), &existing);
            if (get_status.IsNotFound()) {
                return std::error_code{};
            }
            if (!get_status.ok()) {
                spdlog::error("RocksDB Get failed on '{}': {}", name_, get_status.ToString());
                return to_error_code(get_status, Access::Read);
            }

            auto status = engine_->db().Delete(write_options_, column_, to_slice(key));
            if (!status.ok()) {
                spdlog::error("RocksDB Delete failed on '{}': {}", name_, status.ToString());
                return to_error_code(status, Access::Write);
            }
            watch_.notify(key);
            return std::error_code{};
        });
}

awaitable<std::error_code> Map::clear() {
    co_return co_await engine_->pool().execute(
        [this]() {
            rocksdb::WriteBatch batch;
            std::vector<std::string> removed;
            {
                std::unique_ptr<rocksdb::Iterator> it(
                    engine_->db().NewIterator(iter_options_, column_));
                for (it->SeekToFirst(); it->Valid(); it->Next()) {
                    batch.Delete(column_, it->key());
                    removed.push_back(it->key().ToString());
                }
                if (!it->status().ok()) {
                    spdlog::error("RocksDB iteration failed on '{}': {}",
                                  name_, it->status().ToString());
                    return to_error_code(it->status(), Access::Read);
                }
            }

            auto status = engine_->db().Write(write_options_, &batch);
            if (!status.ok()) {
                spdlog::error("RocksDB clear() failed on '{}': {}", name_, status.ToString());
                return to_error_code(status, Access::Write);
            }
            for (const auto& key : removed) {
                watch_.notify(key);
            }
            spdlog::debug("Cleared {} keys from '{}'", removed.size(), name_);
            return std::error_code{};
        });
}

awaitable<std::error_code> Map::compact() {
    co_return co_await engine_->pool().execute(
        [this]() {
            auto status = engine_->db().CompactRange(
                rocksdb::CompactRangeOptions{}, column_, nullptr, nullptr);
            if (!status.ok()) {
                spdlog::error("RocksDB CompactRange failed on '{}': {}",
                              name_, status.ToString());
            }
            return to_error_code(status, Access::Write);
        });
}

// ── Streams ──────────────────────────────────────────────────────────────────

template <typename S>
S Map::stream(Bound bound) {
    auto state = std::make_shared<State>(engine_->db(), column_, iter_options_,
                                         S::direction, std::move(bound));
    return S(shared_from_this(), engine_->pool(), std::move(state));
}

Items Map::entries()                          { return stream<Items>(Bound::none()); }
Items Map::entries_from(std::string key)      { return stream<Items>(Bound::from(std::move(key))); }
Items Map::entries_prefix(std::string prefix) { return stream<Items>(Bound::prefix(std::move(prefix))); }

ItemsRev Map::entries_rev()                          { return stream<ItemsRev>(Bound::none()); }
ItemsRev Map::entries_rev_from(std::string key)      { return stream<ItemsRev>(Bound::from(std::move(key))); }
ItemsRev Map::entries_rev_prefix(std::string prefix) { return stream<ItemsRev>(Bound::prefix(std::move(prefix))); }

Keys Map::keys()                          { return stream<Keys>(Bound::none()); }
Keys Map::keys_from(std::string key)      { return stream<Keys>(Bound::from(std::move(key))); }
Keys Map::keys_prefix(std::string prefix) { return stream<Keys>(Bound::prefix(std::move(prefix))); }

KeysRev Map::keys_rev()                          { return stream<KeysRev>(Bound::none()); }
KeysRev Map::keys_rev_from(std::string key)      { return stream<KeysRev>(Bound::from(std::move(key))); }
KeysRev Map::keys_rev_prefix(std::string prefix) { return stream<KeysRev>(Bound::prefix(std::move(prefix))); }

// ── Introspection ────────────────────────────────────────────────────────────

std::optional<std::string> Map::property(std::string_view name) const {
    return engine_->property(column_, name);
}

std::optional<uint64_t> Map::property_integer(std::string_view name) const {
    return engine_->property_integer(column_, name);
}

} // namespace sluice::storage

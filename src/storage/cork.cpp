#include "storage/cork.hpp"

#include "storage/engine.hpp"
#include "storage/map.hpp"
#include "storage/options.hpp"
#include "storage/status.hpp"

#include <rocksdb/db.h>

#include <spdlog/spdlog.h>

#include <map>
#include <stdexcept>
#include <utility>

namespace sluice::storage {

Cork::Cork(std::shared_ptr<Engine> engine)
    : engine_(std::move(engine))
{
    engine_->cork_opened();
}

Cork::Cork(Cork&& other) noexcept
    : engine_(std::move(other.engine_))
    , batch_(std::move(other.batch_))
    , touched_(std::move(other.touched_))
    , committed_(other.committed_)
    , released_(other.released_)
{
    other.released_ = true;
}

Cork::~Cork() {
    if (!committed_ && !touched_.empty()) {
        spdlog::debug("Discarding uncommitted cork of {} operations", touched_.size());
    }
    release();
}

void Cork::release() noexcept {
    if (!released_) {
        released_ = true;
        engine_->cork_closed();
    }
}

void Cork::check_open(const Map& map) const {
    if (committed_) {
        throw std::logic_error("cork already committed");
    }
    if (&map.engine() != engine_.get()) {
        throw std::invalid_argument("map '" + map.name() + "' belongs to another database");
    }
}

void Cork::put(Map& map, std::string_view key, std::string_view value) {
    check_open(map);
    auto status = batch_.Put(map.column(),
                             rocksdb::Slice{key.data(), key.size()},
                             rocksdb::Slice{value.data(), value.size()});
    if (!status.ok()) {
        throw std::runtime_error("cork put failed: " + status.ToString());
    }
    touched_.push_back(Touch{map.shared_from_this(), std::string(key), false});
}

void Cork::del(Map& map, std::string_view key) {
    check_open(map);
    auto status = batch_.Delete(map.column(), rocksdb::Slice{key.data(), key.size()});
    if (!status.ok()) {
        throw std::runtime_error("cork delete failed: " + status.ToString());
    }
    touched_.push_back(Touch{map.shared_from_this(), std::string(key), true});
}

std::error_code Cork::changed_keys(std::vector<const Touch*>& out) const {
    // Presence of each key as the batch leaves it, in operation order.
    std::map<std::pair<const Map*, std::string_view>, bool> present;
    const auto options = read_options_default(engine_->config());

    for (const auto& touch : touched_) {
        auto slot = present.find({touch.map.get(), touch.key});
        if (!touch.removal) {
            present.insert_or_assign({touch.map.get(), touch.key}, true);
            out.push_back(&touch);
            continue;
        }

        bool existed = false;
        if (slot != present.end()) {
            existed = slot->second;
        } else {
            rocksdb::PinnableSlice value;
            auto status = engine_->db().Get(options, touch.map->column(),
                                            rocksdb::Slice{touch.key.data(), touch.key.size()},
                                            &value);
            if (!status.ok() && !status.IsNotFound()) {
                spdlog::error("RocksDB Get failed on '{}' before cork commit: {}",
                              touch.map->name(), status.ToString());
                return to_error_code(status, Access::Read);
            }
            existed = status.ok();
        }
        present.insert_or_assign({touch.map.get(), touch.key}, false);
        if (existed) {
            out.push_back(&touch);
        }
    }
    return {};
}

boost::asio::awaitable<std::error_code> Cork::commit() {
    if (committed_) {
        co_return std::error_code{};
    }

    auto ec = co_await engine_->pool().execute(
        [this]() {
            std::vector<const Touch*> changed;
            if (auto ec = changed_keys(changed)) {
                return ec;
            }

            auto status = engine_->db().Write(write_options_default(engine_->config()), &batch_);
            if (!status.ok()) {
                spdlog::error("RocksDB batch write of {} operations failed: {}",
                              touched_.size(), status.ToString());
                return to_error_code(status, Access::Write);
            }
            for (const auto* touch : changed) {
                touch->map->watches().notify(touch->key);
            }
            return std::error_code{};
        });

    if (!ec) {
        committed_ = true;
        release();
    }
    co_return ec;
}

} // namespace sluice::storage

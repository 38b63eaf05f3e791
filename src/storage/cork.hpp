#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <rocksdb/write_batch.h>

namespace sluice::storage {

class Engine;
class Map;

// ── Cork ─────────────────────────────────────────────────────────────────────
//
// Buffered write batch over one or more Maps of the same Engine.  Nothing
// reaches the engine until commit(), which applies every buffered operation
// atomically or none of them:
//
//   auto cork = events->cork();
//   cork.put(*events, id, body);
//   cork.put(*index, by_room_key, id);
//   if (auto ec = co_await cork.commit()) { ... }
//
// A del() of a key that is absent when the batch commits, and was not put
// earlier in the same Cork, is a no-op for watchers, as with Map::remove.
//
// A Cork dropped before commit() discards its operations.  After a
// successful commit the Cork is spent; further put()/del() throw
// std::logic_error.
//
// Not thread-safe; owned by one coroutine.

class Cork {
public:
    explicit Cork(std::shared_ptr<Engine> engine);
    ~Cork();

    Cork(Cork&& other) noexcept;
    Cork& operator=(Cork&&) = delete;

    Cork(const Cork&)            = delete;
    Cork& operator=(const Cork&) = delete;

    void put(Map& map, std::string_view key, std::string_view value);
    void del(Map& map, std::string_view key);

    // Apply the batch in one engine write, then notify the watchers of every
    // written key.  Fails with errc::write_error when the engine rejects the
    // batch; nothing is applied in that case and the Cork may be retried.
    boost::asio::awaitable<std::error_code> commit();

    // Buffered operations.
    [[nodiscard]] std::size_t size() const noexcept { return touched_.size(); }
    [[nodiscard]] bool empty() const noexcept { return touched_.empty(); }

    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    struct Touch {
        std::shared_ptr<Map> map;
        std::string key;
        bool removal;
    };

    void check_open(const Map& map) const;
    void release() noexcept;

    // Keys whose watchers a successful write wakes.  Blocking.
    std::error_code changed_keys(std::vector<const Touch*>& out) const;

    std::shared_ptr<Engine> engine_;
    rocksdb::WriteBatch batch_;
    std::vector<Touch> touched_;
    bool committed_ = false;
    bool released_ = false;
};

} // namespace sluice::storage

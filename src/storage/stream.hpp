#pragma once

#include "storage/pool.hpp"
#include "storage/state.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace sluice::storage {

class Map;

// Key-only projection.
using Key = std::string_view;

// One pull: advance the cursor, then fetch in `Item`'s projection.
template <typename Item>
std::error_code step(State& state, std::optional<Item>& out) {
    if (auto ec = state.advance()) {
        return ec;
    }
    if constexpr (std::is_same_v<Item, KeyVal>) {
        out = state.fetch_entry();
    } else {
        static_assert(std::is_same_v<Item, Key>, "Stream item is KeyVal or Key");
        out = state.fetch_key();
    }
    return {};
}

// ── Stream ───────────────────────────────────────────────────────────────────
//
// Lazy, single-pass pull sequence over one Map.  Each next() runs one step()
// on a pool worker:
//
//   auto items = map->entries_prefix("user:");
//   for (;;) {
//       auto [ec, item] = co_await items.next();
//       if (ec || !item) break;
//       use(item->key, item->value);
//   }
//
// Items are views into the cursor's iterator: they stay valid until the
// following next() and must be copied out to be kept longer.  Dropping the
// Stream invalidates them too.
//
// Once next() has reported the end (or an error) it never touches the
// engine again.  Destroying a Stream cancels its queued or running step;
// a next() still awaiting it completes with operation_canceled.

template <typename Item, Direction Dir>
class Stream {
public:
    using item_type = Item;

    static constexpr Direction direction = Dir;

    Stream(std::shared_ptr<Map> map, Pool& pool, std::shared_ptr<State> state)
        : cursor_(std::make_shared<Cursor>(std::move(map), pool, std::move(state)))
    {}

    ~Stream() { cancel(); }

    Stream(Stream&&) noexcept = default;

    Stream& operator=(Stream&& other) noexcept {
        if (this != &other) {
            cancel();
            cursor_ = std::move(other.cursor_);
        }
        return *this;
    }

    Stream(const Stream&)            = delete;
    Stream& operator=(const Stream&) = delete;

    // The next item, or std::nullopt at the end.  An error ends the stream.
    // The returned awaitable does not refer to the Stream itself.
    boost::asio::awaitable<std::tuple<std::error_code, std::optional<Item>>> next() {
        return pull(cursor_);
    }

    // True once next() has reported the end or an error.
    [[nodiscard]] bool done() const noexcept { return !cursor_ || cursor_->done; }

    [[nodiscard]] const State& state() const noexcept { return *cursor_->state; }

private:
    // Everything a pull touches after resuming.  Shared by the Stream and
    // every in-flight next(), so dropping the Stream mid-pull is safe.
    struct Cursor {
        Cursor(std::shared_ptr<Map> m, Pool& p, std::shared_ptr<State> s)
            : map(std::move(m))
            , pool(&p)
            , state(std::move(s))
            , ticket(std::make_shared<Pool::Ticket>())
        {}

        std::shared_ptr<Map> map;       // keeps the column and the Pool alive
        Pool* pool;
        std::shared_ptr<State> state;   // shared with a step on a worker
        std::shared_ptr<Pool::Ticket> ticket;
        bool done = false;
    };

    static boost::asio::awaitable<std::tuple<std::error_code, std::optional<Item>>>
    pull(std::shared_ptr<Cursor> cursor) {
        if (!cursor || cursor->done) {
            co_return std::make_tuple(std::error_code{}, std::optional<Item>{});
        }

        auto [ec, item] = co_await cursor->pool->template query<std::optional<Item>>(
            [state = cursor->state](std::optional<Item>& out) {
                return step(*state, out);
            },
            cursor->ticket);

        if (ec || !item) {
            cursor->done = true;
        }
        co_return std::make_tuple(ec, item);
    }

    void cancel() {
        if (cursor_) {
            cursor_->pool->cancel(cursor_->ticket);
        }
    }

    std::shared_ptr<Cursor> cursor_;
};

using Items    = Stream<KeyVal, Direction::Forward>;
using ItemsRev = Stream<KeyVal, Direction::Reverse>;
using Keys     = Stream<Key, Direction::Forward>;
using KeysRev  = Stream<Key, Direction::Reverse>;

} // namespace sluice::storage

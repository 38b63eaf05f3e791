#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <rocksdb/options.h>
#include <rocksdb/slice.h>

namespace rocksdb {
class ColumnFamilyHandle;
class DB;
class Iterator;
} // namespace rocksdb

namespace sluice::storage {

enum class Direction {
    Forward,
    Reverse,
};

// Restricts an iteration.  `From` starts at the first key at or past
// `key` in the iteration direction; `Prefix` yields only keys starting
// with `key`.
struct Bound {
    enum class Kind {
        None,
        From,
        Prefix,
    };

    Kind        kind = Kind::None;
    std::string key;

    static Bound none() { return {}; }
    static Bound from(std::string key) { return {Kind::From, std::move(key)}; }
    static Bound prefix(std::string key) { return {Kind::Prefix, std::move(key)}; }
};

// One entry under the cursor.  Both views alias the iterator's buffers.
struct KeyVal {
    std::string_view key;
    std::string_view value;
};

// Smallest key greater than every key starting with `prefix`, or
// std::nullopt when no such key exists (the prefix is all 0xff bytes).
[[nodiscard]] std::optional<std::string> prefix_successor(std::string_view prefix);

// ── State ────────────────────────────────────────────────────────────────────
//
// Positioned, direction- and bound-aware cursor over one column.  Every
// Stream adapter pulls with step() (stream.hpp): one advance() followed by
// one fetch in the adapter's projection.
//
// The native iterator is created on the first advance(), so a State that is
// never stepped never touches the engine, and the iterator's implicit
// snapshot is taken at the initial positioning.
//
// Borrow discipline: the views returned by fetch_entry()/fetch_key() point
// into the iterator and are invalidated by the next advance().  The caller
// must be done with one entry before stepping again.
//
// Blocking.  Not thread-safe; one step runs at a time.  advance() is
// virtual so a cursor can be decorated, e.g. to instrument or fail a step.

class State {
public:
    State(rocksdb::DB& db,
          rocksdb::ColumnFamilyHandle* column,
          const rocksdb::ReadOptions& options,
          Direction direction,
          Bound bound);
    virtual ~State();

    State(const State&)            = delete;
    State& operator=(const State&) = delete;

    // Move one entry in the iteration direction; the first call performs
    // the initial positioning instead.  Returns the iterator's error, if any.
    virtual std::error_code advance();

    // The entry under the cursor, or std::nullopt when not positioned on one.
    [[nodiscard]] std::optional<KeyVal> fetch_entry() const;
    [[nodiscard]] std::optional<std::string_view> fetch_key() const;

    [[nodiscard]] bool initialized() const noexcept { return initialized_; }
    [[nodiscard]] bool valid() const;

    // A positioning was attempted and found nothing further.
    [[nodiscard]] bool exhausted() const { return initialized_ && !valid(); }

    [[nodiscard]] Direction direction() const noexcept { return direction_; }
    [[nodiscard]] const Bound& bound() const noexcept { return bound_; }

private:
    void seek_initial();

    rocksdb::DB& db_;
    rocksdb::ColumnFamilyHandle* column_;
    rocksdb::ReadOptions options_;
    const Direction direction_;
    const Bound bound_;

    // Iterate bounds; options_ points at these slices.
    std::string lower_;
    std::optional<std::string> upper_;
    rocksdb::Slice lower_slice_;
    rocksdb::Slice upper_slice_;

    std::unique_ptr<rocksdb::Iterator> it_;
    bool initialized_ = false;
};

} // namespace sluice::storage

#include "storage/state.hpp"

#include "storage/status.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>

#include <spdlog/spdlog.h>

namespace sluice::storage {

std::optional<std::string> prefix_successor(std::string_view prefix) {
    std::string upper(prefix);
    while (!upper.empty() && static_cast<unsigned char>(upper.back()) == 0xff) {
        upper.pop_back();
    }
    if (upper.empty()) {
        return std::nullopt;
    }
    upper.back() = static_cast<char>(static_cast<unsigned char>(upper.back()) + 1);
    return upper;
}

State::State(rocksdb::DB& db,
             rocksdb::ColumnFamilyHandle* column,
             const rocksdb::ReadOptions& options,
             Direction direction,
             Bound bound)
    : db_(db)
    , column_(column)
    , options_(options)
    , direction_(direction)
    , bound_(std::move(bound))
{
    if (bound_.kind == Bound::Kind::Prefix && !bound_.key.empty()) {
        lower_ = bound_.key;
        lower_slice_ = rocksdb::Slice(lower_);
        options_.iterate_lower_bound = &lower_slice_;

        upper_ = prefix_successor(bound_.key);
        if (upper_) {
            upper_slice_ = rocksdb::Slice(*upper_);
            options_.iterate_upper_bound = &upper_slice_;
        }
    }
}

State::~State() = default;

bool State::valid() const {
    return it_ && it_->Valid();
}

void State::seek_initial() {
    it_.reset(db_.NewIterator(options_, column_));

    const bool from = bound_.kind == Bound::Kind::From;
    const bool prefix = bound_.kind == Bound::Kind::Prefix && !bound_.key.empty();

    if (direction_ == Direction::Forward) {
        if (from || prefix) {
            it_->Seek(bound_.key);
        } else {
            it_->SeekToFirst();
        }
        return;
    }

    if (from) {
        it_->SeekForPrev(bound_.key);
    } else {
        // With a prefix the upper bound confines SeekToLast to the range.
        it_->SeekToLast();
    }
}

std::error_code State::advance() {
    if (!initialized_) {
        initialized_ = true;
        seek_initial();
    } else if (it_->Valid()) {
        if (direction_ == Direction::Forward) {
            it_->Next();
        } else {
            it_->Prev();
        }
    }

    if (!it_->Valid()) {
        auto status = it_->status();
        if (!status.ok()) {
            spdlog::error("Iterator failed: {}", status.ToString());
            return to_error_code(status, Access::Read);
        }
    }
    return {};
}

std::optional<KeyVal> State::fetch_entry() const {
    if (!valid()) {
        return std::nullopt;
    }
    const auto key = it_->key();
    const auto value = it_->value();
    return KeyVal{
        .key   = {key.data(), key.size()},
        .value = {value.data(), value.size()},
    };
}

std::optional<std::string_view> State::fetch_key() const {
    if (!valid()) {
        return std::nullopt;
    }
    const auto key = it_->key();
    return std::string_view{key.data(), key.size()};
}

} // namespace sluice::storage

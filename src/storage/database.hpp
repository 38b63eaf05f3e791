#pragma once

#include "common/db_config.hpp"
#include "storage/descriptor.hpp"
#include "storage/engine.hpp"
#include "storage/map.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sluice::storage {

// ── Database ─────────────────────────────────────────────────────────────────
//
// Top-level handle: opens the Engine and one Map per live descriptor, and
// hands Maps out by name.
//
//   auto db = Database::open(cfg, describe({"events", "rooms"}));
//   auto events = db->get("events");
//   co_await events->insert("e1", body);
//
// The set of Maps is fixed at open, so lookups need no lock.  close() (or
// the destructor) cancels pending watches and stops the Pool; the io_context
// running awaiting coroutines must outlive the Database.

class Database {
public:
    // Throws std::system_error(errc::open_error) when the engine cannot be
    // opened.
    [[nodiscard]] static std::unique_ptr<Database> open(
        const DbConfig& cfg, const std::vector<Descriptor>& desc);

    [[nodiscard]] static std::unique_ptr<Database> open(
        const DbConfig& cfg, const std::vector<Descriptor>& desc, std::error_code& ec);

    ~Database();

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // Throws std::system_error(errc::not_found) for an unknown name.
    [[nodiscard]] std::shared_ptr<Map> get(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<Map> get(std::string_view name, std::error_code& ec) const;

    // nullptr for an unknown name.
    [[nodiscard]] std::shared_ptr<Map> find(std::string_view name) const noexcept;

    // Names of every Map, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] bool is_read_only() const noexcept { return engine_->is_read_only(); }
    [[nodiscard]] bool is_secondary() const noexcept { return engine_->is_secondary(); }

    [[nodiscard]] Engine& engine() const noexcept { return *engine_; }

    // Cancel every pending watch and stop the Pool.  Uncommitted Corks are
    // discarded when dropped.  Idempotent.
    void close();

private:
    explicit Database(std::shared_ptr<Engine> engine);

    std::shared_ptr<Engine> engine_;
    std::map<std::string, std::shared_ptr<Map>, std::less<>> maps_;
    bool closed_ = false;
};

} // namespace sluice::storage

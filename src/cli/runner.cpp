#include "cli/runner.hpp"

#include "common/error.hpp"
#include "storage/database.hpp"
#include "storage/map.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace sluice::cli {

namespace asio = boost::asio;

using storage::Database;
using storage::Map;

namespace {

std::shared_ptr<Map> map_or_report(const Database& db, const std::string& column,
                                   std::ostream& out) {
    auto map = db.find(column);
    if (!map) {
        out << "ERROR unknown column '" << column << "'\n";
    }
    return map;
}

void report(const std::error_code& ec, std::ostream& out) {
    out << "ERROR " << ec.message() << '\n';
}

// Print every item of `stream`, one per line.
template <typename S>
asio::awaitable<bool> drain(S stream, std::ostream& out) {
    std::size_t n = 0;
    for (;;) {
        auto [ec, item] = co_await stream.next();
        if (ec) {
            report(ec, out);
            co_return false;
        }
        if (!item) {
            break;
        }
        if constexpr (std::is_same_v<typename S::item_type, storage::KeyVal>) {
            out << item->key << '\t' << item->value << '\n';
        } else {
            out << *item << '\n';
        }
        ++n;
    }
    spdlog::debug("sluice-cli: {} items", n);
    co_return true;
}

} // namespace

asio::awaitable<int> execute(Database& db, Command cmd, std::ostream& out) {
    if (auto* c = std::get_if<GetCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;
        auto [ec, value] = co_await map->get(c->key);
        if (ec == errc::not_found) {
            out << "NOT_FOUND\n";
        } else if (ec) {
            report(ec, out);
            co_return 1;
        } else {
            out << value << '\n';
        }
    } else if (auto* c = std::get_if<PutCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;
        if (auto ec = co_await map->put(c->key, c->value)) {
            report(ec, out);
            co_return 1;
        }
        out << "OK\n";
    } else if (auto* c = std::get_if<DelCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;
        if (auto ec = co_await map->del(c->key)) {
            report(ec, out);
            co_return 1;
        }
        out << "OK\n";
    } else if (auto* c = std::get_if<CountCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;
        auto [ec, n] = co_await map->count_prefix(c->prefix);
        if (ec) {
            report(ec, out);
            co_return 1;
        }
        out << n << '\n';
    } else if (auto* c = std::get_if<ScanCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;
        bool ok = false;
        if (c->keys_only) {
            ok = co_await drain(map->keys_prefix(c->prefix), out);
        } else if (c->reverse) {
            ok = co_await drain(map->entries_rev_prefix(c->prefix), out);
        } else {
            ok = co_await drain(map->entries_prefix(c->prefix), out);
        }
        if (!ok) co_return 1;
    } else if (auto* c = std::get_if<FromCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;
        bool ok = false;
        if (c->reverse) {
            ok = co_await drain(map->entries_rev_from(c->key), out);
        } else {
            ok = co_await drain(map->entries_from(c->key), out);
        }
        if (!ok) co_return 1;
    } else if (auto* c = std::get_if<StatsCmd>(&cmd)) {
        const auto name = c->column.value_or("default");
        auto* column = db.engine().column(name);
        if (!column) {
            out << "ERROR unknown column '" << name << "'\n";
            co_return 1;
        }
        auto value = db.engine().property(column, c->property);
        if (!value) {
            out << "ERROR unknown property '" << c->property << "'\n";
            co_return 1;
        }
        out << *value << '\n';
    } else if (auto* c = std::get_if<FilesCmd>(&cmd)) {
        for (const auto& f : db.engine().file_list()) {
            if (c->column && f.column != *c->column) {
                continue;
            }
            out << f.column << '\t' << f.name << "\tL" << f.level << '\t'
                << f.size << " bytes\t" << f.entries << " entries\t"
                << f.deletions << " deletions\n";
        }
    } else if (auto* c = std::get_if<WatchCmd>(&cmd)) {
        auto map = map_or_report(db, c->column, out);
        if (!map) co_return 1;

        // Registered before the wrapped command runs, so its write is seen.
        auto waiter = map->watch(c->key);

        auto parsed = parse_command(c->then);
        if (auto* err = std::get_if<ParseError>(&parsed)) {
            out << "ERROR " << err->message << '\n';
            co_return 1;
        }
        if (co_await execute(db, std::get<Command>(std::move(parsed)), out) != 0) {
            co_return 1;
        }

        if (!waiter->resolved()) {
            out << "UNCHANGED\n";
            co_return 1;
        }
        if (auto ec = co_await waiter->wait()) {
            report(ec, out);
            co_return 1;
        }
        out << "CHANGED\n";
    }

    co_return 0;
}

} // namespace sluice::cli

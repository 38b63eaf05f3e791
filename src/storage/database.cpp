#include "storage/database.hpp"

#include <spdlog/spdlog.h>

namespace sluice::storage {

Database::Database(std::shared_ptr<Engine> engine)
    : engine_(std::move(engine))
{}

std::unique_ptr<Database> Database::open(const DbConfig& cfg,
                                         const std::vector<Descriptor>& desc) {
    auto engine = Engine::open(cfg, desc);
    std::unique_ptr<Database> db(new Database(engine));

    for (const auto& d : desc) {
        if (d.dropped) {
            continue;
        }
        db->maps_.emplace(d.name, Map::open(engine, d.name));
        spdlog::debug("Opened map '{}'", d.name);
    }

    spdlog::info("Database ready at {}: {} maps", cfg.path, db->maps_.size());
    return db;
}

std::unique_ptr<Database> Database::open(const DbConfig& cfg,
                                         const std::vector<Descriptor>& desc,
                                         std::error_code& ec) {
    ec.clear();
    try {
        return open(cfg, desc);
    } catch (const std::system_error& e) {
        ec = e.code();
    } catch (const std::exception& e) {
        spdlog::error("Database open failed: {}", e.what());
        ec = make_error_code(errc::open_error);
    }
    return nullptr;
}

Database::~Database() {
    close();
}

void Database::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    for (auto& [_, map] : maps_) {
        map->watches().cancel_all();
    }
    if (engine_->active_corks() > 0) {
        spdlog::debug("Closing with {} uncommitted corks", engine_->active_corks());
    }
    engine_->close();
    spdlog::info("Database closed: {}", engine_->config().path);
}

std::shared_ptr<Map> Database::get(std::string_view name) const {
    std::error_code ec;
    auto map = get(name, ec);
    if (ec) {
        throw std::system_error(ec, "map '" + std::string(name) + "'");
    }
    return map;
}

std::shared_ptr<Map> Database::get(std::string_view name, std::error_code& ec) const {
    ec.clear();
    auto map = find(name);
    if (!map) {
        ec = make_error_code(errc::not_found);
    }
    return map;
}

std::shared_ptr<Map> Database::find(std::string_view name) const noexcept {
    auto it = maps_.find(name);
    return it == maps_.end() ? nullptr : it->second;
}

std::vector<std::string> Database::names() const {
    std::vector<std::string> result;
    result.reserve(maps_.size());
    for (const auto& [name, _] : maps_) {
        result.push_back(name);
    }
    return result;
}

} // namespace sluice::storage

#include "common/db_config.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace sluice {

// ── validate ──────────────────────────────────────────────────────────────────

void validate(const DbConfig& cfg) {
    if (cfg.path.empty()) {
        throw std::runtime_error("--db-path must not be empty");
    }

    if (cfg.read_only && cfg.secondary) {
        throw std::runtime_error("--read-only and --secondary are mutually exclusive");
    }

    if (cfg.secondary) {
        if (cfg.secondary_path.empty()) {
            throw std::runtime_error("--secondary requires --secondary-path");
        }
        if (cfg.secondary_path == cfg.path) {
            throw std::runtime_error("--secondary-path must differ from --db-path");
        }
    }

    if (cfg.pool_workers == 0) {
        throw std::runtime_error("--pool-workers must be > 0");
    }
    if (cfg.pool_queue_mult == 0) {
        throw std::runtime_error("--pool-queue-mult must be > 0");
    }

    if (cfg.compression != "none" && cfg.compression != "snappy" &&
        cfg.compression != "lz4" && cfg.compression != "zstd") {
        throw std::runtime_error(fmt::format(
            "--compression must be one of none|snappy|lz4|zstd, got '{}'",
            cfg.compression));
    }
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("db-path",
            po::value<std::string>()->default_value("./data/db"),
            "Database directory")
        ("read-only",
            po::bool_switch()->default_value(false),
            "Open the database without write access")
        ("secondary",
            po::bool_switch()->default_value(false),
            "Open the database as a read replica of a running primary")
        ("secondary-path",
            po::value<std::string>()->default_value(""),
            "Directory for the read replica's own info log")
        ("repair",
            po::bool_switch()->default_value(false),
            "Run RocksDB repair before opening")
        ("never-drop-columns",
            po::bool_switch()->default_value(false),
            "Keep columns that are described as dropped")
        ("pool-workers",
            po::value<uint32_t>()->default_value(32),
            "Number of blocking worker threads")
        ("pool-queue-mult",
            po::value<uint32_t>()->default_value(4),
            "Queue slots per worker thread")
        ("cache-capacity-mb",
            po::value<uint32_t>()->default_value(256),
            "Shared block cache capacity in MiB")
        ("max-open-files",
            po::value<int32_t>()->default_value(-1),
            "Table files kept open (-1 = unlimited)")
        ("checksums",
            po::value<bool>()->default_value(true),
            "Verify block checksums on reads")
        ("compression",
            po::value<std::string>()->default_value("lz4"),
            "Block compression: none|snappy|lz4|zstd")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── config_from ───────────────────────────────────────────────────────────────

DbConfig config_from(const po::variables_map& vm) {
    DbConfig cfg;
    cfg.path               = vm["db-path"].as<std::string>();
    cfg.read_only          = vm["read-only"].as<bool>();
    cfg.secondary          = vm["secondary"].as<bool>();
    cfg.secondary_path     = vm["secondary-path"].as<std::string>();
    cfg.repair             = vm["repair"].as<bool>();
    cfg.never_drop_columns = vm["never-drop-columns"].as<bool>();
    cfg.pool_workers       = vm["pool-workers"].as<uint32_t>();
    cfg.pool_queue_mult    = vm["pool-queue-mult"].as<uint32_t>();
    cfg.cache_capacity_mb  = vm["cache-capacity-mb"].as<uint32_t>();
    cfg.max_open_files     = vm["max-open-files"].as<int32_t>();
    cfg.checksums          = vm["checksums"].as<bool>();
    cfg.compression        = vm["compression"].as<std::string>();
    cfg.log_level          = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

// ── parse_config ──────────────────────────────────────────────────────────────

DbConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("database options");
    desc.add_options()("help,h", "Show this help message and exit");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    return config_from(vm);
}

uint32_t pool_worker_count(const DbConfig& cfg) noexcept {
    return std::clamp(cfg.pool_workers, kMinPoolWorkers, kMaxPoolWorkers);
}

uint32_t pool_queue_size(const DbConfig& cfg) noexcept {
    const uint64_t slots =
        static_cast<uint64_t>(pool_worker_count(cfg)) * cfg.pool_queue_mult;
    return static_cast<uint32_t>(std::clamp<uint64_t>(slots, kMinQueueSize, kMaxQueueSize));
}

} // namespace sluice

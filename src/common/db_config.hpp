#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace sluice {

// ── DbConfig ──────────────────────────────────────────────────────────────────
// Full configuration for one opened database.
// Populated by parse_config() / config_from() from CLI arguments, or filled in
// directly by embedding code and tests.

struct DbConfig {
    std::string path = "./data/db";     // Database directory
    bool        read_only = false;      // Open without write access
    bool        secondary = false;      // Open as a read replica of a primary
    std::string secondary_path;         // Replica's own info-log directory
    bool        repair = false;         // Run RocksDB repair before opening
    bool        never_drop_columns = false; // Keep columns described as dropped

    uint32_t    pool_workers = 32;      // Blocking worker threads
    uint32_t    pool_queue_mult = 4;    // Queue slots per worker

    uint32_t    cache_capacity_mb = 256; // Shared block cache
    int32_t     max_open_files = -1;     // -1 keeps every table file open
    bool        checksums = true;        // Verify block checksums on reads
    std::string compression = "lz4";     // none|snappy|lz4|zstd

    std::string log_level = "info";      // spdlog level string
};

// Worker and queue limits applied when the pool is sized.
inline constexpr uint32_t kMinPoolWorkers = 1;
inline constexpr uint32_t kMaxPoolWorkers = 1024;
inline constexpr uint32_t kMinQueueSize   = 1;
inline constexpr uint32_t kMaxQueueSize   = 4096;

// ── validate ──────────────────────────────────────────────────────────────────
// Throws std::runtime_error with a human-readable message if `cfg` is unusable:
//   - path must not be empty
//   - read_only and secondary are mutually exclusive
//   - secondary requires a secondary_path distinct from path
//   - pool_workers and pool_queue_mult must be > 0
//   - compression must be one of none|snappy|lz4|zstd

void validate(const DbConfig& cfg);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with database
// options.  Exposed so tools can extend the option set and for help-text
// generation.

void add_options(boost::program_options::options_description& desc);

// ── config_from ───────────────────────────────────────────────────────────────
// Build and validate a DbConfig from an already notified variables_map that
// was parsed against add_options().

[[nodiscard]] DbConfig config_from(const boost::program_options::variables_map& vm);

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a DbConfig.
//
// On success: returns a fully validated DbConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (including the option help text for --help).

[[nodiscard]] DbConfig parse_config(int argc, char* argv[]);

// Effective queue capacity for a pool sized from `cfg`.
[[nodiscard]] uint32_t pool_queue_size(const DbConfig& cfg) noexcept;

// Effective worker count for a pool sized from `cfg`.
[[nodiscard]] uint32_t pool_worker_count(const DbConfig& cfg) noexcept;

} // namespace sluice

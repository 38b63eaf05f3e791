#pragma once

#include "common/db_config.hpp"
#include "storage/descriptor.hpp"

#include <memory>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>

namespace sluice::storage {

// ── Engine-wide option profiles ──────────────────────────────────────────────

// Database options for `cfg`'s operating mode.
[[nodiscard]] rocksdb::Options db_options(const DbConfig& cfg);

// Column options for one descriptor; tables share `cache`.
[[nodiscard]] rocksdb::ColumnFamilyOptions cf_options(
    const DbConfig& cfg,
    const Descriptor& desc,
    const std::shared_ptr<rocksdb::Cache>& cache);

// ── Per-Map profiles, computed once when a Map is opened ─────────────────────

// Point reads: verify checksums per config, populate the block cache.
[[nodiscard]] rocksdb::ReadOptions read_options_default(const DbConfig& cfg);

// Iteration: verify checksums per config, leave the block cache alone so a
// long scan does not evict the point-read working set.
[[nodiscard]] rocksdb::ReadOptions iter_options_default(const DbConfig& cfg);

// Writes: engine-default durability (WAL on, no fsync per write).
[[nodiscard]] rocksdb::WriteOptions write_options_default(const DbConfig& cfg);

[[nodiscard]] rocksdb::CompressionType compression_type(const std::string& name);

} // namespace sluice::storage

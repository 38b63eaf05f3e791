#include "storage/options.hpp"

#include <rocksdb/table.h>

namespace sluice::storage {

rocksdb::Options db_options(const DbConfig& cfg) {
    rocksdb::Options options;

    const bool writable = !cfg.read_only && !cfg.secondary;
    options.create_if_missing = writable;
    options.create_missing_column_families = writable;

    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    // A read replica must keep every table file open to follow the primary.
    options.max_open_files = cfg.secondary ? -1 : cfg.max_open_files;
    options.paranoid_checks = cfg.checksums;

    return options;
}

rocksdb::ColumnFamilyOptions cf_options(
    const DbConfig& cfg,
    const Descriptor& desc,
    const std::shared_ptr<rocksdb::Cache>& cache)
{
    rocksdb::ColumnFamilyOptions options;
    options.OptimizeLevelStyleCompaction();
    options.compression = compression_type(cfg.compression);
    if (desc.write_buffer_mb > 0) {
        options.write_buffer_size = desc.write_buffer_mb * 1024 * 1024;
    }

    rocksdb::BlockBasedTableOptions table;
    table.block_cache = cache;
    table.block_size = desc.block_size;
    table.cache_index_and_filter_blocks = true;
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));

    return options;
}

rocksdb::ReadOptions read_options_default(const DbConfig& cfg) {
    rocksdb::ReadOptions options;
    options.verify_checksums = cfg.checksums;
    options.fill_cache = true;
    return options;
}

rocksdb::ReadOptions iter_options_default(const DbConfig& cfg) {
    rocksdb::ReadOptions options;
    options.verify_checksums = cfg.checksums;
    options.fill_cache = false;
    return options;
}

rocksdb::WriteOptions write_options_default(const DbConfig& /*cfg*/) {
    rocksdb::WriteOptions options;
    options.sync = false;
    options.disableWAL = false;
    return options;
}

rocksdb::CompressionType compression_type(const std::string& name) {
    if (name == "snappy") return rocksdb::kSnappyCompression;
    if (name == "lz4")    return rocksdb::kLZ4Compression;
    if (name == "zstd")   return rocksdb::kZSTD;
    return rocksdb::kNoCompression;
}

} // namespace sluice::storage

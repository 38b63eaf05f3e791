#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sluice::storage {

// ── Descriptor ───────────────────────────────────────────────────────────────
//
// Describes one keyspace (RocksDB column family).  The list of descriptors
// handed to Engine::open() is the authoritative schema: described columns
// are created when absent, and columns described as `dropped` are removed
// from the database on the next writable open.

struct Descriptor {
    std::string name;
    bool        dropped = false;       // Scheduled for deletion; never opened as a Map
    std::size_t block_size = 4 * 1024; // Table block size in bytes
    std::size_t write_buffer_mb = 0;   // Memtable size; 0 keeps the engine default
};

// Convenience for tests and tools: one live descriptor per name.
[[nodiscard]] std::vector<Descriptor> describe(const std::vector<std::string>& names);

} // namespace sluice::storage

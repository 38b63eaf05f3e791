#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace sluice {

// ── Error kinds ───────────────────────────────────────────────────────────────
//
// Every failure surfaced by the storage layer is one of these, carried as a
// std::error_code.  Cancellation is reported separately as
// std::errc::operation_canceled.

enum class errc {
    open_error  = 1, // engine unusable at startup (corruption, version, permission)
    not_found   = 2, // key or column does not exist
    io_error    = 3, // storage failure on a point or batch operation
    pool_panic  = 4, // a blocking dispatch threw on a pool worker
    write_error = 5, // a write or batch commit rejected by the engine
};

[[nodiscard]] const std::error_category& storage_category() noexcept;

[[nodiscard]] std::error_code make_error_code(errc e) noexcept;

// True when `ec` is a cancellation, whichever layer reported it.
[[nodiscard]] bool is_canceled(const std::error_code& ec) noexcept;

} // namespace sluice

template <>
struct std::is_error_code_enum<sluice::errc> : std::true_type {};

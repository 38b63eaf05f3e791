#include "common/error.hpp"

namespace sluice {

namespace {

class StorageCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "sluice.storage"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::open_error:  return "database could not be opened";
            case errc::not_found:   return "not found";
            case errc::io_error:    return "storage I/O error";
            case errc::pool_panic:  return "blocking dispatch failed on a pool worker";
            case errc::write_error: return "write rejected by the storage engine";
        }
        return "unknown storage error";
    }
};

} // anonymous namespace

const std::error_category& storage_category() noexcept {
    static const StorageCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), storage_category()};
}

bool is_canceled(const std::error_code& ec) noexcept {
    return ec == std::errc::operation_canceled;
}

} // namespace sluice

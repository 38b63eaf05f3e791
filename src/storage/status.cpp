#include "storage/status.hpp"

#include <rocksdb/status.h>

namespace sluice::storage {

std::error_code to_error_code(const rocksdb::Status& status, Access access) {
    if (status.ok()) {
        return {};
    }
    if (status.IsNotFound()) {
        return make_error_code(errc::not_found);
    }

    if (access == Access::Write) {
        if (status.IsNoSpace() || status.IsBusy() || status.IsTimedOut() ||
            status.IsAborted() || status.IsTryAgain() || status.IsNotSupported() ||
            status.IsInvalidArgument()) {
            return make_error_code(errc::write_error);
        }
    }

    return make_error_code(errc::io_error);
}

} // namespace sluice::storage

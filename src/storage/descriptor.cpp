#include "storage/descriptor.hpp"

namespace sluice::storage {

std::vector<Descriptor> describe(const std::vector<std::string>& names) {
    std::vector<Descriptor> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(Descriptor{.name = name});
    }
    return result;
}

} // namespace sluice::storage

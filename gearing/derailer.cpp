#include "derailer.hpp"
#include <common/errors.hpp>
#include <algorithm>

namespace bikecalc {

namespace {

uint32_t spread(const CogList& cogs) {
    auto [smallest, largest] = std::minmax_element(cogs.begin(), cogs.end());
    return *largest - *smallest;
}

}  // namespace

uint32_t derailer_capacity(const CogList& front_cogs, const CogList& rear_cogs) {
    if (front_cogs.empty()) {
        throw InvalidInput("derailer capacity needs front_cogs, got an empty list");
    }
    if (rear_cogs.empty()) {
        throw InvalidInput("derailer capacity needs rear_cogs, got an empty list");
    }
    return spread(front_cogs) + spread(rear_cogs);
}

}  // namespace bikecalc

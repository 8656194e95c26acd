#include "bicycle.hpp"
#include <algorithm>

namespace bikecalc {

Bicycle Bicycle::sorted_cogs() const {
    Bicycle result = *this;
    std::sort(result.front_cogs.begin(), result.front_cogs.end());
    std::sort(result.rear_cogs.begin(), result.rear_cogs.end());
    return result;
}

}  // namespace bikecalc

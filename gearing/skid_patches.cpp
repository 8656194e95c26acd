#include "skid_patches.hpp"
#include <common/errors.hpp>
#include <numeric>

namespace bikecalc {

uint32_t skid_patches(const CogPair& pair, bool ambidextrous) {
    if (pair.rear == 0) {
        throw DomainError("skid patches undefined for cog pair " + to_string(pair) +
                          ": rear cog has no teeth");
    }

    uint32_t divisor = std::gcd(pair.front, pair.rear);
    uint32_t numerator = pair.front / divisor;
    uint32_t denominator = pair.rear / divisor;

    if (ambidextrous && numerator % 2 != 0) {
        return 2 * denominator;
    }
    return denominator;
}

CogPairMap<uint32_t> num_skid_patches(const CogList& front_cogs, const CogList& rear_cogs,
                                      bool ambidextrous) {
    return map_cog_pairs(front_cogs, rear_cogs, [ambidextrous](const CogPair& pair) {
        return skid_patches(pair, ambidextrous);
    });
}

}  // namespace bikecalc

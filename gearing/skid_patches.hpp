#ifndef BIKECALC_GEARING_SKID_PATCHES_HPP
#define BIKECALC_GEARING_SKID_PATCHES_HPP

#include "cog_pairs.hpp"

namespace bikecalc {

// Number of distinct places a fixed-gear rear tire wears when the rider
// skids with the cranks level.
//
// Write front / rear in lowest terms as a / b. Each skid starts with the
// wheel advanced by a multiple of 1/b of a revolution, so a single-footed
// skidder wears b patches. Skidding with either foot forward shifts the
// crank by half a turn, which lands between existing patches only when a
// is odd; an ambidextrous skidder then wears 2 * b patches.
uint32_t skid_patches(const CogPair& pair, bool ambidextrous = false);

CogPairMap<uint32_t> num_skid_patches(const CogList& front_cogs, const CogList& rear_cogs,
                                      bool ambidextrous = false);

}  // namespace bikecalc

#endif // BIKECALC_GEARING_SKID_PATCHES_HPP

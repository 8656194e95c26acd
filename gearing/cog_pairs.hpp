#ifndef BIKECALC_GEARING_COG_PAIRS_HPP
#define BIKECALC_GEARING_COG_PAIRS_HPP

#include <bicycle/bicycle.hpp>
#include <compare>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bikecalc {

// One gear combination: a front chainring and a rear sprocket
struct CogPair {
    uint32_t front = 0;
    uint32_t rear = 0;

    auto operator<=>(const CogPair&) const = default;
};

// Per-gear results are keyed by the cog pair that produced them
template <typename T>
using CogPairMap = std::map<CogPair, T>;

// "(front, rear)", used in error messages and logs
std::string to_string(const CogPair& pair);

// Every (front, rear) combination, each exactly once.
// Throws InvalidInput if either list is empty, DomainError if a cog
// has no teeth.
std::vector<CogPair> cog_pairs(const CogList& front_cogs, const CogList& rear_cogs);

// Apply fn to every cog pair and collect the results
template <typename Fn>
auto map_cog_pairs(const CogList& front_cogs, const CogList& rear_cogs, Fn&& fn)
    -> CogPairMap<decltype(fn(CogPair{}))> {
    CogPairMap<decltype(fn(CogPair{}))> result;
    for (const CogPair& pair : cog_pairs(front_cogs, rear_cogs)) {
        result.emplace(pair, fn(pair));
    }
    return result;
}

}  // namespace bikecalc

#endif // BIKECALC_GEARING_COG_PAIRS_HPP

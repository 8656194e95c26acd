#include "cog_pairs.hpp"
#include <common/errors.hpp>
#include <algorithm>

namespace bikecalc {

std::string to_string(const CogPair& pair) {
    return "(" + std::to_string(pair.front) + ", " + std::to_string(pair.rear) + ")";
}

std::vector<CogPair> cog_pairs(const CogList& front_cogs, const CogList& rear_cogs) {
    if (front_cogs.empty()) {
        throw InvalidInput("front_cogs must not be empty");
    }
    if (rear_cogs.empty()) {
        throw InvalidInput("rear_cogs must not be empty");
    }
    if (std::find(front_cogs.begin(), front_cogs.end(), 0u) != front_cogs.end()) {
        throw DomainError("front_cogs contains a cog with no teeth");
    }
    if (std::find(rear_cogs.begin(), rear_cogs.end(), 0u) != rear_cogs.end()) {
        throw DomainError("rear_cogs contains a cog with no teeth");
    }

    std::vector<CogPair> pairs;
    pairs.reserve(front_cogs.size() * rear_cogs.size());
    for (uint32_t front : front_cogs) {
        for (uint32_t rear : rear_cogs) {
            pairs.push_back(CogPair{front, rear});
        }
    }

    // A cog listed twice still names a single gear
    std::sort(pairs.begin(), pairs.end());
    pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
    return pairs;
}

}  // namespace bikecalc

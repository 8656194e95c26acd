#ifndef BIKECALC_GEARING_DERAILER_HPP
#define BIKECALC_GEARING_DERAILER_HPP

#include <bicycle/bicycle.hpp>

namespace bikecalc {

// Total chain wrap a rear derailer must take up for the cog set:
// the tooth spread of the chainrings plus the tooth spread of the cassette.
// Throws InvalidInput if either list is empty.
uint32_t derailer_capacity(const CogList& front_cogs, const CogList& rear_cogs);

}  // namespace bikecalc

#endif // BIKECALC_GEARING_DERAILER_HPP

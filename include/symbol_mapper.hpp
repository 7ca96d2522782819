#ifndef DTMFDEC_NODE_SYMBOL_MAPPER_HPP
#define DTMFDEC_NODE_SYMBOL_MAPPER_HPP

#include <optional>

#include "dtmf_tones.hpp"

namespace dtmfdec::node {

/// Lookups into the fixed 4x4 DTMF keypad:
///
///            1209  1336  1477  1633
///     697     1     2     3     A
///     770     4     5     6     B
///     852     7     8     9     C
///     941     *     0     #     D
class SymbolMapper {
public:
    /// Symbol for an exact (row, column) frequency pair, or nullopt.
    static std::optional<char> resolve(int low_hz, int high_hz);

    /// Row/column frequencies for a keypad symbol (case-insensitive for
    /// A-D), or nullopt if the character is not on the keypad.
    static std::optional<TonePair> tones_for(char symbol);

    /// True for the 16 keypad symbols.
    static bool is_symbol(char symbol);
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_SYMBOL_MAPPER_HPP

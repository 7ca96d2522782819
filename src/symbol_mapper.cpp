#include "symbol_mapper.hpp"

#include <cctype>
#include <cstddef>

namespace dtmfdec::node {

namespace {

constexpr char kKeypad[4][4] = {
    {'1', '2', '3', 'A'},
    {'4', '5', '6', 'B'},
    {'7', '8', '9', 'C'},
    {'*', '0', '#', 'D'},
};

int index_of(const std::array<int, 4>& group, int hz) {
    for (std::size_t i = 0; i < group.size(); ++i) {
        if (group[i] == hz) return static_cast<int>(i);
    }
    return -1;
}

} // namespace

std::optional<char> SymbolMapper::resolve(int low_hz, int high_hz) {
    const int row = index_of(kLowGroupHz, low_hz);
    const int col = index_of(kHighGroupHz, high_hz);
    if (row < 0 || col < 0) return std::nullopt;
    return kKeypad[row][col];
}

std::optional<TonePair> SymbolMapper::tones_for(char symbol) {
    const char key = static_cast<char>(
        std::toupper(static_cast<unsigned char>(symbol)));

    for (std::size_t row = 0; row < kLowGroupHz.size(); ++row) {
        for (std::size_t col = 0; col < kHighGroupHz.size(); ++col) {
            if (kKeypad[row][col] == key) {
                return TonePair{kLowGroupHz[row], kHighGroupHz[col], 0.0, 0.0};
            }
        }
    }
    return std::nullopt;
}

bool SymbolMapper::is_symbol(char symbol) {
    return tones_for(symbol).has_value();
}

} // namespace dtmfdec::node

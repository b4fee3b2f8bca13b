#include "util/uuid.hpp"

#include <array>
#include <random>

namespace kbindexer::uuid {
namespace {

std::mt19937& rng() {
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

}  // namespace

std::string generate() {
    static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                  '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::uniform_int_distribution<int> dist(0, 15);

    std::string out(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        int nibble = dist(rng());
        if (i == 14) {
            nibble = 4;
        } else if (i == 19) {
            nibble = 8 | (nibble & 0x3);
        }
        out[i] = kHex[nibble];
    }
    return out;
}

}  // namespace kbindexer::uuid

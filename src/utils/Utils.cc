#include "vault/utils/Utils.hh"

#include <cstdint>
#include <random>

namespace vault {

std::string makeHexId(std::string_view prefix, std::size_t digits) {
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937 gen(std::random_device{}());

    std::string id(prefix);
    id.reserve(prefix.size() + digits);

    // Eight nibbles per draw
    std::uint32_t bits = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        if (i % 8 == 0) {
            bits = gen();
        }
        id.push_back(kHex[bits & 0xF]);
        bits >>= 4;
    }
    return id;
}

} // namespace vault

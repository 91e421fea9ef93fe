#pragma once

#include <cstdint>
#include <string>

namespace obr::domain {

enum class Side : uint8_t { Bid, Ask };

inline std::string to_string(Side side) {
    return side == Side::Bid ? "bid" : "ask";
}

} // namespace obr::domain

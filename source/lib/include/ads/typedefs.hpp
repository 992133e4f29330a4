#pragma once

#include <cstdint>

#include <ads/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    None = 0u,
    Console = Bit(0u),
    File = Bit(1u),
    DetailTime = Bit(2u),
    DetailFile = Bit(3u),
    DetailLine = Bit(4u),
    DetailFunction = Bit(5u),

    DetailAll = DetailTime | DetailFile | DetailLine | DetailFunction,
};
ENABLE_BITFIELD_OPERATORS(LogFlags);

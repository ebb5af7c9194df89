#pragma once

#include <cstdint>

#include <pdfbind/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    None = 0u,
    Console = Bit(0u),
    File = Bit(1u),
    DetailTime = Bit(2u),
    DetailFile = Bit(3u),
    DetailLine = Bit(4u),
    DetailColumn = DetailLine | Bit(5u),
    DetailFunction = Bit(6u),
    DetailStacktrace = Bit(7u),

    DetailAll = DetailTime | DetailFile | DetailLine | DetailColumn | DetailFunction,
    DetailAllStacktrace = DetailAll | DetailStacktrace,
};
ENABLE_BITFIELD_OPERATORS(LogFlags);

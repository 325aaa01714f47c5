#pragma once

#include <cstdint>

#include <imgui.h>

#include "termtris/core/Types.hpp"

namespace termtris::gui_sdl {

// Same palette everywhere a block is drawn, keyed by grid fill value
inline ImU32 colorForCell(termtris::core::CellValue value)
{
    switch (value) {
        case 1: return IM_COL32(  0, 255, 255, 255); // I
        case 2: return IM_COL32(255, 255,   0, 255); // O
        case 3: return IM_COL32(160,  32, 240, 255); // T
        case 4: return IM_COL32(  0, 255,   0, 255); // S
        case 5: return IM_COL32(255,   0,   0, 255); // Z
        case 6: return IM_COL32(  0,   0, 255, 255); // J
        case 7: return IM_COL32(255, 165,   0, 255); // L
        default: break;
    }
    return IM_COL32(200, 200, 200, 255);
}

inline void unpackImU32(ImU32 col, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b, std::uint8_t& a)
{
    r = (col >> IM_COL32_R_SHIFT) & 0xFF;
    g = (col >> IM_COL32_G_SHIFT) & 0xFF;
    b = (col >> IM_COL32_B_SHIFT) & 0xFF;
    a = (col >> IM_COL32_A_SHIFT) & 0xFF;
}

} // namespace termtris::gui_sdl

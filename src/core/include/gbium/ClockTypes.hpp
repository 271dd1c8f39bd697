// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of Gbium.
//
// Gbium is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Gbium is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Gbium.
// If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <cstdint>

namespace gbium {

// Clock rate for devices
enum class ClockRate : uint8_t {
    Machine = 1,   // 1MHz machine cycle (CPU bus, timer, DMA, serial)
    Dot     = 4,   // 4MHz dot clock (PPU)
};

// DMG timing constants
namespace timing {
    constexpr uint64_t DOT_HZ     = 4'194'304;  // Master crystal
    constexpr uint64_t MACHINE_HZ = 1'048'576;  // One machine cycle = 4 dots

    constexpr uint64_t DOTS_PER_MACHINE_CYCLE = 4;
    constexpr uint64_t DOTS_PER_LINE          = 456;
    constexpr uint64_t LINES_PER_FRAME        = 154;
    constexpr uint64_t VISIBLE_LINES          = 144;
    constexpr uint64_t DOTS_PER_FRAME         = DOTS_PER_LINE * LINES_PER_FRAME;  // 70224
    constexpr uint64_t CYCLES_PER_FRAME       = DOTS_PER_FRAME / DOTS_PER_MACHINE_CYCLE;  // 17556

    // ~59.73 frames per second
    constexpr double FRAMES_PER_SECOND = static_cast<double>(DOT_HZ) / DOTS_PER_FRAME;
}

} // namespace gbium

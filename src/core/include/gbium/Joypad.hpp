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

#ifndef GBIUM_JOYPAD_HPP
#define GBIUM_JOYPAD_HPP

#include "ClockTypes.hpp"
#include "InterruptController.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gbium {

// The eight logical buttons. Values 0-3 are the direction group,
// 4-7 the action group; within a group the value is the P1 line.
enum class Button : uint8_t {
    Right  = 0,
    Left   = 1,
    Up     = 2,
    Down   = 3,
    A      = 4,
    B      = 5,
    Select = 6,
    Start  = 7,
};

constexpr size_t kButtonCount = 8;

const char* button_name(Button button);
std::optional<Button> button_from_name(std::string_view name);

// P1/JOYP register (0xFF00).
//
// Bits 5 and 4 select the action and direction groups (0 = selected).
// Bits 3-0 are the OR of the selected groups' buttons, active low.
// Any high-to-low transition on bits 3-0 requests the joypad interrupt;
// transitions are sampled once per machine cycle.
class Joypad {
public:
    void reset();

    // Satisfies MemoryMappedDevice concept
    uint8_t read(uint16_t offset) const;
    void write(uint16_t offset, uint8_t value);

    void set_button(Button button, bool pressed);
    bool is_pressed(Button button) const;

    // Raw pressed state, bit N = Button(N)
    uint8_t pressed_mask() const { return pressed_; }

    // A pressed button in a selected group holds its P1 line low;
    // this is what wakes the CPU from STOP
    bool any_line_low() const { return input_lines() != 0x0F; }

    // Sample the input lines and raise the interrupt on a falling edge
    void tick(InterruptController& irq);

private:
    uint8_t select_ = 0x30;    // Bits 5-4 as last written
    uint8_t pressed_ = 0x00;
    uint8_t last_lines_ = 0x0F;

    uint8_t input_lines() const;
};

struct JoypadBinding {
    Joypad& joypad;
    InterruptController& irq;

    static constexpr ClockRate clock_rate = ClockRate::Machine;

    void tick() { joypad.tick(irq); }
};

} // namespace gbium

#endif // GBIUM_JOYPAD_HPP

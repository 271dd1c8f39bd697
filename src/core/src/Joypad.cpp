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

#include <gbium/Joypad.hpp>

#include <array>

namespace gbium {

namespace {

constexpr std::array<const char*, kButtonCount> kButtonNames = {
    "right", "left", "up", "down", "a", "b", "select", "start"
};

} // anonymous namespace

const char* button_name(Button button) {
    return kButtonNames[static_cast<size_t>(button) & 0x07];
}

std::optional<Button> button_from_name(std::string_view name) {
    for (size_t i = 0; i < kButtonNames.size(); ++i) {
        if (name == kButtonNames[i]) {
            return static_cast<Button>(i);
        }
    }
    return std::nullopt;
}

void Joypad::reset() {
    select_ = 0x30;
    pressed_ = 0x00;
    last_lines_ = 0x0F;
}

uint8_t Joypad::read(uint16_t /*offset*/) const {
    return static_cast<uint8_t>(0xC0 | select_ | input_lines());
}

void Joypad::write(uint16_t /*offset*/, uint8_t value) {
    select_ = value & 0x30;
}

void Joypad::set_button(Button button, bool pressed) {
    const uint8_t bit = static_cast<uint8_t>(1u << static_cast<uint8_t>(button));
    if (pressed) {
        pressed_ |= bit;
    } else {
        pressed_ &= static_cast<uint8_t>(~bit);
    }
}

bool Joypad::is_pressed(Button button) const {
    return (pressed_ >> static_cast<uint8_t>(button)) & 1;
}

void Joypad::tick(InterruptController& irq) {
    const uint8_t lines = input_lines();
    if ((last_lines_ & ~lines) & 0x0F) {
        irq.request(InterruptKind::Joypad);
    }
    last_lines_ = lines;
}

uint8_t Joypad::input_lines() const {
    uint8_t low = 0x00;
    if ((select_ & 0x10) == 0) {
        low |= pressed_ & 0x0F;
    }
    if ((select_ & 0x20) == 0) {
        low |= (pressed_ >> 4) & 0x0F;
    }
    return static_cast<uint8_t>(~low & 0x0F);
}

} // namespace gbium

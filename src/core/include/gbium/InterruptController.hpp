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

#ifndef GBIUM_INTERRUPT_CONTROLLER_HPP
#define GBIUM_INTERRUPT_CONTROLLER_HPP

#include <cstdint>
#include <optional>

namespace gbium {

// Interrupt sources in priority order (VBlank highest).
// The enumerator value is the bit position in IE/IF.
enum class InterruptKind : uint8_t {
    VBlank = 0,
    Stat   = 1,
    Timer  = 2,
    Serial = 3,
    Joypad = 4,
};

constexpr uint8_t kInterruptMask = 0x1F;

constexpr uint8_t interrupt_bit(InterruptKind kind) {
    return static_cast<uint8_t>(1u << static_cast<uint8_t>(kind));
}

// Service routine address: 0x40, 0x48, 0x50, 0x58, 0x60
constexpr uint16_t interrupt_vector(InterruptKind kind) {
    return static_cast<uint16_t>(0x40 + 8 * static_cast<uint8_t>(kind));
}

constexpr const char* interrupt_name(InterruptKind kind) {
    switch (kind) {
        case InterruptKind::VBlank: return "vblank";
        case InterruptKind::Stat:   return "stat";
        case InterruptKind::Timer:  return "timer";
        case InterruptKind::Serial: return "serial";
        case InterruptKind::Joypad: return "joypad";
    }
    return "unknown";
}

// Interrupt enable (IE, 0xFFFF) and request (IF, 0xFF0F) registers.
//
// Devices call request() from their tick; the CPU consults pending() before
// each opcode fetch and acknowledge()s the kind it services. Request bits
// stay set until acknowledged or overwritten through IF.
class InterruptController {
public:
    void request(InterruptKind kind) {
        if_ |= interrupt_bit(kind);
    }

    void acknowledge(InterruptKind kind) {
        if_ &= static_cast<uint8_t>(~interrupt_bit(kind));
    }

    // IE stores all eight bits; only the low five take part in dispatch
    uint8_t enable_mask() const { return ie_; }
    void set_enable_mask(uint8_t value) { ie_ = value; }

    // IF bits 7..5 are unconnected and read as 1
    uint8_t request_mask() const { return static_cast<uint8_t>(if_ | 0xE0); }
    void set_request_mask(uint8_t value) { if_ = value & kInterruptMask; }

    // Highest-priority kind that is both enabled and requested
    std::optional<InterruptKind> pending() const {
        const uint8_t active = ie_ & if_ & kInterruptMask;
        if (active == 0) {
            return std::nullopt;
        }
        for (uint8_t bit = 0; bit < 5; ++bit) {
            if (active & (1u << bit)) {
                return static_cast<InterruptKind>(bit);
            }
        }
        return std::nullopt;
    }

    // HALT exits when any enabled request is present, regardless of IME
    bool wake_pending() const {
        return (ie_ & if_ & kInterruptMask) != 0;
    }

    void reset() {
        ie_ = 0x00;
        if_ = 0x00;
    }

private:
    uint8_t ie_ = 0x00;
    uint8_t if_ = 0x00;
};

} // namespace gbium

#endif // GBIUM_INTERRUPT_CONTROLLER_HPP

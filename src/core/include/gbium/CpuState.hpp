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

#ifndef GBIUM_CPU_STATE_HPP
#define GBIUM_CPU_STATE_HPP

#include <cstdint>
#include <optional>

namespace gbium {

enum class CpuMode : uint8_t {
    Running,
    Halted,     // HALT: waiting for an enabled interrupt request
    Stopped,    // STOP: waiting for a button press
    Locked,     // Illegal opcode executed; only the clock advances
};

const char* cpu_mode_name(CpuMode mode);

// F register bits 7..4
struct Flags {
    bool zero = false;
    bool subtract = false;
    bool half_carry = false;
    bool carry = false;

    static constexpr uint8_t Z = 0x80;
    static constexpr uint8_t N = 0x40;
    static constexpr uint8_t H = 0x20;
    static constexpr uint8_t C = 0x10;

    static constexpr Flags from_byte(uint8_t f) {
        return Flags{(f & Z) != 0, (f & N) != 0, (f & H) != 0, (f & C) != 0};
    }

    constexpr uint8_t to_byte() const {
        return static_cast<uint8_t>((zero ? Z : 0) | (subtract ? N : 0) |
                                    (half_carry ? H : 0) | (carry ? C : 0));
    }

    constexpr bool operator==(const Flags&) const = default;
};

// Opcode that locked the CPU, and where it was fetched from
struct IllegalOpcode {
    uint8_t opcode;
    uint16_t address;
};

// SM83 register file and execution state.
// F is stored packed; its low nibble is always zero.
struct CpuState {
    uint8_t a = 0x00;
    uint8_t f = 0x00;
    uint8_t b = 0x00;
    uint8_t c = 0x00;
    uint8_t d = 0x00;
    uint8_t e = 0x00;
    uint8_t h = 0x00;
    uint8_t l = 0x00;
    uint16_t sp = 0x0000;
    uint16_t pc = 0x0000;

    bool ime = false;
    bool ime_pending = false;   // EI executed, IME sets after the next instruction
    bool halt_bug = false;      // Next opcode fetch does not advance PC
    CpuMode mode = CpuMode::Running;
    std::optional<IllegalOpcode> illegal;

    uint16_t af() const { return static_cast<uint16_t>((a << 8) | f); }
    uint16_t bc() const { return static_cast<uint16_t>((b << 8) | c); }
    uint16_t de() const { return static_cast<uint16_t>((d << 8) | e); }
    uint16_t hl() const { return static_cast<uint16_t>((h << 8) | l); }

    void set_af(uint16_t v) { a = static_cast<uint8_t>(v >> 8); f = static_cast<uint8_t>(v & 0xF0); }
    void set_bc(uint16_t v) { b = static_cast<uint8_t>(v >> 8); c = static_cast<uint8_t>(v); }
    void set_de(uint16_t v) { d = static_cast<uint8_t>(v >> 8); e = static_cast<uint8_t>(v); }
    void set_hl(uint16_t v) { h = static_cast<uint8_t>(v >> 8); l = static_cast<uint8_t>(v); }

    Flags flags() const { return Flags::from_byte(f); }
    void set_flags(Flags flags) { f = flags.to_byte(); }

    // Power-on: everything zero, executing from 0x0000 (boot ROM)
    void reset() { *this = CpuState{}; }

    // Register values the DMG boot ROM leaves behind
    void apply_post_boot() {
        reset();
        set_af(0x01B0);
        set_bc(0x0013);
        set_de(0x00D8);
        set_hl(0x014D);
        sp = 0xFFFE;
        pc = 0x0100;
    }
};

inline const char* cpu_mode_name(CpuMode mode) {
    switch (mode) {
        case CpuMode::Running: return "running";
        case CpuMode::Halted:  return "halted";
        case CpuMode::Stopped: return "stopped";
        case CpuMode::Locked:  return "locked";
    }
    return "unknown";
}

} // namespace gbium

#endif // GBIUM_CPU_STATE_HPP

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

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace gbium {

// Called for every CPU write to 0xFF10-0xFF3F
using AudioWriteCallback = std::function<void(uint16_t addr, uint8_t value)>;

// Sound register block (0xFF10-0xFF3F).
//
// No synthesis happens here: values are stored for read-back with the DMG
// unused-bit masks applied, and every write is forwarded to an optional
// external collaborator. Powering off through NR52 clears NR10-NR51 and
// ignores further writes to them until power returns.
class AudioRegisters {
public:
    static constexpr size_t kSize = 0x30;

    void reset();

    uint8_t read(uint16_t offset) const;
    void write(uint16_t offset, uint8_t value);

    bool powered() const { return (regs_[REG_NR52] & 0x80) != 0; }

    void set_write_callback(AudioWriteCallback cb) { write_callback_ = std::move(cb); }

    static constexpr uint8_t REG_NR52 = 0x16;
    static constexpr uint8_t WAVE_RAM = 0x20;

private:
    std::array<uint8_t, kSize> regs_{};
    AudioWriteCallback write_callback_;
};

} // namespace gbium

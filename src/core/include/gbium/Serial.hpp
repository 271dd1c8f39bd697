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

#ifndef GBIUM_SERIAL_HPP
#define GBIUM_SERIAL_HPP

#include "ClockTypes.hpp"
#include "InterruptController.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace gbium {

using SerialByteCallback = std::function<void(uint8_t value)>;

// Serial port (SB 0xFF01, SC 0xFF02) with no link partner attached.
//
// An internally clocked transfer (SC bits 7 and 0 set) shifts the byte out
// over 1024 machine cycles, shifts in 0xFF, clears SC bit 7 and requests the
// serial interrupt. Externally clocked transfers never complete.
// Each byte shifted out is captured, which is how test ROMs report results.
class Serial {
public:
    static constexpr uint32_t kTransferCycles = 1024;

    void reset();

    // Register access (offsets 0x00-0x01 from 0xFF01)
    uint8_t read(uint16_t offset) const;
    void write(uint16_t offset, uint8_t value);

    void tick(InterruptController& irq);

    bool transferring() const { return remaining_ != 0; }

    // Bytes shifted out so far
    const std::string& output() const { return output_; }
    void clear_output() { output_.clear(); }

    void set_byte_callback(SerialByteCallback cb) { byte_callback_ = std::move(cb); }

    static constexpr uint8_t REG_SB = 0x00;
    static constexpr uint8_t REG_SC = 0x01;

private:
    uint8_t sb_ = 0x00;
    uint8_t sc_ = 0x00;
    uint32_t remaining_ = 0;
    std::string output_;
    SerialByteCallback byte_callback_;
};

struct SerialBinding {
    Serial& serial;
    InterruptController& irq;

    static constexpr ClockRate clock_rate = ClockRate::Machine;

    void tick() { serial.tick(irq); }
};

} // namespace gbium

#endif // GBIUM_SERIAL_HPP

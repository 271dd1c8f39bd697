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

#include <gbium/Serial.hpp>

namespace gbium {

void Serial::reset() {
    sb_ = 0x00;
    sc_ = 0x00;
    remaining_ = 0;
    output_.clear();
}

uint8_t Serial::read(uint16_t offset) const {
    if ((offset & 0x01) == REG_SB) {
        return sb_;
    }
    return static_cast<uint8_t>(sc_ | 0x7E);
}

void Serial::write(uint16_t offset, uint8_t value) {
    if ((offset & 0x01) == REG_SB) {
        sb_ = value;
        return;
    }

    sc_ = value & 0x81;
    if ((sc_ & 0x81) == 0x81) {
        remaining_ = kTransferCycles;
        output_.push_back(static_cast<char>(sb_));
        if (byte_callback_) {
            byte_callback_(sb_);
        }
    } else {
        remaining_ = 0;
    }
}

void Serial::tick(InterruptController& irq) {
    if (remaining_ == 0) {
        return;
    }
    if (--remaining_ == 0) {
        sb_ = 0xFF;
        sc_ &= 0x7F;
        irq.request(InterruptKind::Serial);
    }
}

} // namespace gbium

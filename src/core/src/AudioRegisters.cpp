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

#include <gbium/AudioRegisters.hpp>

#include <algorithm>

namespace gbium {

namespace {

// Bits that read back as 1 regardless of the stored value
constexpr std::array<uint8_t, 0x20> kReadMasks = {
    0x80, 0x3F, 0x00, 0xFF, 0xBF,        // NR10-NR14
    0xFF, 0x3F, 0x00, 0xFF, 0xBF,        // unused, NR21-NR24
    0x7F, 0xFF, 0x9F, 0xFF, 0xBF,        // NR30-NR34
    0xFF, 0xFF, 0x00, 0x00, 0xBF,        // unused, NR41-NR44
    0x00, 0x00, 0x70,                    // NR50-NR52
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF,        // 0xFF27-0xFF2F unused
    0xFF, 0xFF, 0xFF, 0xFF,
};

constexpr uint16_t kAudioBase = 0xFF10;

} // anonymous namespace

void AudioRegisters::reset() {
    regs_.fill(0x00);
}

uint8_t AudioRegisters::read(uint16_t offset) const {
    offset %= kSize;
    if (offset >= WAVE_RAM) {
        return regs_[offset];
    }
    return static_cast<uint8_t>(regs_[offset] | kReadMasks[offset]);
}

void AudioRegisters::write(uint16_t offset, uint8_t value) {
    offset %= kSize;

    if (offset == REG_NR52) {
        regs_[REG_NR52] = value & 0x80;
        if (!powered()) {
            std::fill(regs_.begin(), regs_.begin() + REG_NR52, uint8_t{0});
        }
    } else if (offset >= WAVE_RAM) {
        regs_[offset] = value;
    } else if (powered()) {
        regs_[offset] = value;
    }

    if (write_callback_) {
        write_callback_(static_cast<uint16_t>(kAudioBase + offset), value);
    }
}

} // namespace gbium

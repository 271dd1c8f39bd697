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

#ifndef GBIUM_TYPES_HPP
#define GBIUM_TYPES_HPP

#include <cstdint>
#include <cstddef>

namespace gbium {

// Memory region sizes
constexpr size_t kAddressSpaceSize = 65536;  // 64KB
constexpr size_t kRomBankSize = 16384;       // 16KB per cartridge ROM bank
constexpr size_t kRamBankSize = 8192;        // 8KB per cartridge RAM bank
constexpr size_t kBootRomSize = 256;
constexpr size_t kVramSize = 8192;
constexpr size_t kWorkRamSize = 8192;
constexpr size_t kOamSize = 160;
constexpr size_t kHighRamSize = 127;

// DMG memory map
constexpr uint16_t kCartRomStart = 0x0000;
constexpr uint16_t kCartRomEnd = 0x7FFF;

constexpr uint16_t kVramStart = 0x8000;
constexpr uint16_t kVramEnd = 0x9FFF;

constexpr uint16_t kCartRamStart = 0xA000;
constexpr uint16_t kCartRamEnd = 0xBFFF;

constexpr uint16_t kWorkRamStart = 0xC000;
constexpr uint16_t kWorkRamEnd = 0xDFFF;

constexpr uint16_t kEchoRamStart = 0xE000;   // Mirrors work RAM
constexpr uint16_t kEchoRamEnd = 0xFDFF;

constexpr uint16_t kOamStart = 0xFE00;
constexpr uint16_t kOamEnd = 0xFE9F;

constexpr uint16_t kIoStart = 0xFF00;        // I/O registers
constexpr uint16_t kIoEnd = 0xFF7F;

constexpr uint16_t kHighRamStart = 0xFF80;
constexpr uint16_t kHighRamEnd = 0xFFFE;

// Value seen on reads nothing drives
constexpr uint8_t kOpenBus = 0xFF;

// Key I/O addresses
constexpr uint16_t kJoypadAddr = 0xFF00;
constexpr uint16_t kSerialDataAddr = 0xFF01;
constexpr uint16_t kSerialControlAddr = 0xFF02;
constexpr uint16_t kDivAddr = 0xFF04;
constexpr uint16_t kTimaAddr = 0xFF05;
constexpr uint16_t kTmaAddr = 0xFF06;
constexpr uint16_t kTacAddr = 0xFF07;
constexpr uint16_t kIfAddr = 0xFF0F;
constexpr uint16_t kAudioStart = 0xFF10;
constexpr uint16_t kAudioEnd = 0xFF3F;
constexpr uint16_t kLcdcAddr = 0xFF40;
constexpr uint16_t kStatAddr = 0xFF41;
constexpr uint16_t kLyAddr = 0xFF44;
constexpr uint16_t kDmaAddr = 0xFF46;
constexpr uint16_t kBootRegisterAddr = 0xFF50;
constexpr uint16_t kIeAddr = 0xFFFF;

// Watchpoint types (used by Machine and the debugger service)
enum WatchType : uint8_t {
    WATCH_READ  = 0x01,
    WATCH_WRITE = 0x02,
    WATCH_BOTH  = 0x03
};

} // namespace gbium

#endif // GBIUM_TYPES_HPP

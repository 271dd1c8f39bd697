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

#ifndef GBIUM_OAM_DMA_HPP
#define GBIUM_OAM_DMA_HPP

#include "ClockTypes.hpp"
#include "Types.hpp"
#include <concepts>
#include <cstdint>

namespace gbium {

// Anything the DMA engine can copy from and into
template<typename T>
concept DmaBus = requires(T& bus, uint16_t addr, uint8_t value) {
    { bus.dma_read(addr) } -> std::convertible_to<uint8_t>;
    { bus.oam_write(addr, value) } -> std::same_as<void>;
};

// OAM DMA controller (0xFF46).
//
// Writing XX starts a copy of XX00-XX9F into OAM, one byte per machine
// cycle, after a one-cycle start delay. While a copy is running the CPU
// sees only 0xFF00-0xFFFF. Sources at 0xE000 and above read work RAM 0x2000
// lower. A write during a running copy restarts it once the new start-up
// completes; the old copy continues until then.
class OamDma {
public:
    // Cycles from the register write to the first byte copied
    static constexpr uint32_t kStartDelay = 2;
    static constexpr uint32_t kLength = kOamSize;

    void reset() {
        register_ = 0xFF;
        active_ = false;
        index_ = 0;
        source_ = 0;
        delay_ = 0;
        pending_source_ = 0;
    }

    // Satisfies MemoryMappedDevice concept
    uint8_t read(uint16_t /*offset*/) const { return register_; }

    void write(uint16_t /*offset*/, uint8_t value) {
        register_ = value;
        pending_source_ = static_cast<uint16_t>(value << 8);
        delay_ = kStartDelay;
    }

    // Advance one machine cycle
    template<DmaBus Bus>
    void tick(Bus& bus) {
        if (delay_ > 0 && --delay_ == 0) {
            source_ = pending_source_;
            index_ = 0;
            active_ = true;
        }

        if (!active_) {
            return;
        }
        if (index_ == kLength) {
            active_ = false;
            return;
        }

        uint16_t addr = static_cast<uint16_t>(source_ + index_);
        if (addr >= kEchoRamStart) {
            addr = static_cast<uint16_t>(addr - 0x2000);
        }
        bus.oam_write(static_cast<uint16_t>(index_), bus.dma_read(addr));
        ++index_;
    }

    // CPU bus is restricted to 0xFF00-0xFFFF
    bool active() const { return active_; }

    // Bytes copied so far in the current transfer
    uint32_t progress() const { return index_; }

private:
    uint8_t register_ = 0xFF;
    bool active_ = false;
    uint32_t index_ = 0;
    uint16_t source_ = 0;
    uint32_t delay_ = 0;
    uint16_t pending_source_ = 0;
};

// Clock binding glue: the DMA engine copies against the hardware bus
template<DmaBus Bus>
struct DmaBinding {
    OamDma& dma;
    Bus& bus;

    static constexpr ClockRate clock_rate = ClockRate::Machine;

    void tick() { dma.tick(bus); }
};

} // namespace gbium

#endif // GBIUM_OAM_DMA_HPP

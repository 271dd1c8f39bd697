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

#include "ClockTypes.hpp"
#include "InterruptController.hpp"
#include <cstdint>
#include <functional>

namespace gbium {

// Callback type for CpuBinding debugging hooks
using CpuWatchpointCallback = std::function<void(uint16_t addr, uint8_t value, bool is_write)>;

// CpuBinding is the bus the SM83 core talks to.
//
// Every read(), write() and idle() is one machine cycle: the system clock
// is advanced by four dots first (timer, serial, DMA, then the PPU), and
// the access is performed afterwards, so the CPU observes device state as
// of the end of that cycle.
//
// Optional debugging callback:
// - watchpoint_callback_: Called after each memory access
//
template<typename Hardware, typename SystemClock>
class CpuBinding {
public:
    Hardware& hardware;
    SystemClock& clock;
    uint64_t& cycle_count;

    CpuBinding(Hardware& hardware, SystemClock& clock, uint64_t& cycle_count)
        : hardware(hardware), clock(clock), cycle_count(cycle_count) {}

    uint8_t read(uint16_t addr) {
        idle();
        const uint8_t value = hardware.cpu_read(addr);
        if (watchpoint_callback_) {
            watchpoint_callback_(addr, value, false);
        }
        return value;
    }

    void write(uint16_t addr, uint8_t value) {
        idle();
        hardware.cpu_write(addr, value);
        if (watchpoint_callback_) {
            watchpoint_callback_(addr, value, true);
        }
    }

    void idle() {
        clock.tick_machine_cycle(cycle_count * timing::DOTS_PER_MACHINE_CYCLE);
        ++cycle_count;
    }

    InterruptController& interrupts() { return hardware.irq; }

    void stop() { hardware.enter_stop(); }

    bool stop_wake() const { return hardware.joypad.any_line_low(); }

    // Runtime configuration
    void set_watchpoint_callback(CpuWatchpointCallback cb) {
        watchpoint_callback_ = std::move(cb);
    }

    void clear_watchpoint_callback() { watchpoint_callback_ = nullptr; }

private:
    CpuWatchpointCallback watchpoint_callback_;
};

} // namespace gbium

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

#ifndef GBIUM_TIMER_HPP
#define GBIUM_TIMER_HPP

#include "ClockTypes.hpp"
#include "InterruptController.hpp"
#include <cstdint>

namespace gbium {

// DMG divider and programmable timer (0xFF04-0xFF07).
//
// The divider is a free-running 16-bit counter advanced by 4 every machine
// cycle; DIV is its top byte. TIMA increments on the falling edge of
// (TAC enable && selected counter bit), so writes to DIV or TAC that drop
// that signal also produce an increment.
//
// Overflow sequence, one machine cycle per step:
//   Overflow: TIMA reads 0. A TIMA write here replaces the reload and
//             cancels the interrupt.
//   Reloaded: TIMA = TMA, interrupt requested. TIMA writes are ignored and
//             TMA writes are copied through to TIMA.
//   Normal:   counting resumes.
//
class Timer {
public:
    enum class OverflowState : uint8_t {
        Normal,
        Overflow,
        Reloaded,
    };

    Timer();

    void reset();

    // Register access (offsets 0x00-0x03 from 0xFF04)
    // Satisfies MemoryMappedDevice concept; reads have no side effects
    uint8_t read(uint16_t offset) const;
    void write(uint16_t offset, uint8_t value);

    // Advance one machine cycle
    void tick(InterruptController& irq);

    // Advance several machine cycles
    void step(uint32_t cycles, InterruptController& irq);

    uint16_t counter() const { return counter_; }
    uint8_t div() const { return static_cast<uint8_t>(counter_ >> 8); }
    uint8_t tima() const { return tima_; }
    uint8_t tma() const { return tma_; }
    uint8_t tac() const { return tac_; }
    OverflowState overflow_state() const { return state_; }

    // Preset the internal counter (post-boot state)
    void set_counter(uint16_t value) { counter_ = value; }

    // Register offsets
    static constexpr uint8_t REG_DIV  = 0x00;
    static constexpr uint8_t REG_TIMA = 0x01;
    static constexpr uint8_t REG_TMA  = 0x02;
    static constexpr uint8_t REG_TAC  = 0x03;

    // Counter bit watched for each TAC clock select (4096, 262144, 65536, 16384 Hz)
    static constexpr uint8_t kSelectBits[4] = {9, 3, 5, 7};

private:
    uint16_t counter_ = 0;
    uint8_t tima_ = 0;
    uint8_t tma_ = 0;
    uint8_t tac_ = 0;
    OverflowState state_ = OverflowState::Normal;

    bool timer_input() const;
    void set_counter_with_edge(uint16_t value);
    void increment_tima();
};

// Clock binding glue: ticks the timer against the shared interrupt controller
struct TimerBinding {
    Timer& timer;
    InterruptController& irq;

    static constexpr ClockRate clock_rate = ClockRate::Machine;

    void tick() { timer.tick(irq); }
};

} // namespace gbium

#endif // GBIUM_TIMER_HPP

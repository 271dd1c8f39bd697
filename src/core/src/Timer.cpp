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

#include <gbium/Timer.hpp>

namespace gbium {

Timer::Timer() {
    reset();
}

void Timer::reset() {
    counter_ = 0;
    tima_ = 0;
    tma_ = 0;
    tac_ = 0;
    state_ = OverflowState::Normal;
}

//////////////////////////////////////////////////////////////////////////////
// Register access
//////////////////////////////////////////////////////////////////////////////

uint8_t Timer::read(uint16_t offset) const {
    switch (offset & 0x03) {
    case REG_DIV:
        return div();
    case REG_TIMA:
        return tima_;
    case REG_TMA:
        return tma_;
    case REG_TAC:
    default:
        return static_cast<uint8_t>(tac_ | 0xF8);
    }
}

void Timer::write(uint16_t offset, uint8_t value) {
    switch (offset & 0x03) {
    case REG_DIV:
        // Any write clears the whole counter
        set_counter_with_edge(0);
        break;

    case REG_TIMA:
        if (state_ == OverflowState::Overflow) {
            tima_ = value;
            state_ = OverflowState::Normal;
        } else if (state_ == OverflowState::Normal) {
            tima_ = value;
        }
        break;

    case REG_TMA:
        tma_ = value;
        if (state_ == OverflowState::Reloaded) {
            tima_ = value;
        }
        break;

    case REG_TAC: {
        const bool old_input = timer_input();
        tac_ = value & 0x07;
        if (old_input && !timer_input()) {
            increment_tima();
        }
        break;
    }
    }
}

//////////////////////////////////////////////////////////////////////////////
// Clocking
//////////////////////////////////////////////////////////////////////////////

void Timer::tick(InterruptController& irq) {
    switch (state_) {
    case OverflowState::Overflow:
        tima_ = tma_;
        irq.request(InterruptKind::Timer);
        state_ = OverflowState::Reloaded;
        break;
    case OverflowState::Reloaded:
        state_ = OverflowState::Normal;
        break;
    case OverflowState::Normal:
        break;
    }

    set_counter_with_edge(static_cast<uint16_t>(counter_ + 4));
}

void Timer::step(uint32_t cycles, InterruptController& irq) {
    for (uint32_t i = 0; i < cycles; ++i) {
        tick(irq);
    }
}

bool Timer::timer_input() const {
    if ((tac_ & 0x04) == 0) {
        return false;
    }
    return ((counter_ >> kSelectBits[tac_ & 0x03]) & 1) != 0;
}

void Timer::set_counter_with_edge(uint16_t value) {
    const bool old_input = timer_input();
    counter_ = value;
    if (old_input && !timer_input()) {
        increment_tima();
    }
}

void Timer::increment_tima() {
    ++tima_;
    if (tima_ == 0) {
        state_ = OverflowState::Overflow;
    }
}

} // namespace gbium

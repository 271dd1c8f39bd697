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

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace gbium;
using gbium::test::CpuFixture;

namespace {

bool requested(const InterruptController& irq, InterruptKind kind) {
    return (irq.request_mask() & interrupt_bit(kind)) != 0;
}

} // anonymous namespace

TEST_CASE("Interrupt dispatch", "[cpu][interrupts]") {
    CpuFixture t;
    t.cpu.pc = 0x0123;
    t.cpu.ime = true;
    t.program({0x00});
    t.bus.irq.set_enable_mask(0x1F);

    SECTION("Five cycles, return address pushed, request acknowledged") {
        t.bus.irq.request(InterruptKind::VBlank);
        CHECK(t.step() == 5);
        CHECK(t.cpu.pc == 0x0040);
        CHECK(t.cpu.sp == 0xFFFC);
        CHECK(t.bus.memory[0xFFFD] == 0x01);
        CHECK(t.bus.memory[0xFFFC] == 0x23);
        CHECK_FALSE(t.cpu.ime);
        CHECK_FALSE(requested(t.bus.irq, InterruptKind::VBlank));
    }

    SECTION("Highest priority first, others stay requested") {
        t.bus.irq.request(InterruptKind::Joypad);
        t.bus.irq.request(InterruptKind::Timer);
        t.step();
        CHECK(t.cpu.pc == 0x0050);
        CHECK(requested(t.bus.irq, InterruptKind::Joypad));
    }

    SECTION("Not taken while IME is clear") {
        t.cpu.ime = false;
        t.bus.irq.request(InterruptKind::Serial);
        CHECK(t.step() == 1);
        CHECK(t.cpu.pc == 0x0124);
        CHECK(requested(t.bus.irq, InterruptKind::Serial));
    }

    SECTION("Not taken when the source is disabled") {
        t.bus.irq.set_enable_mask(0x00);
        t.bus.irq.request(InterruptKind::Stat);
        CHECK(t.step() == 1);
        CHECK(t.cpu.pc == 0x0124);
    }
}

TEST_CASE("EI takes effect after the next instruction", "[cpu][interrupts]") {
    CpuFixture t;
    t.bus.irq.set_enable_mask(0x01);
    t.bus.irq.request(InterruptKind::VBlank);

    SECTION("EI then NOP") {
        t.program({0xFB, 0x00, 0x00});
        t.step();
        CHECK_FALSE(t.cpu.ime);
        t.step();
        CHECK(t.cpu.ime);
        CHECK(t.cpu.pc == 0x0002);

        CHECK(t.step() == 5);
        CHECK(t.cpu.pc == 0x0040);
        CHECK(t.bus.memory[0xFFFC] == 0x02);
        CHECK(t.bus.memory[0xFFFD] == 0x00);
    }

    SECTION("EI then DI leaves interrupts disabled") {
        t.program({0xFB, 0xF3, 0x00});
        t.step();
        t.step();
        t.step();
        CHECK_FALSE(t.cpu.ime);
        CHECK(t.cpu.pc == 0x0003);
    }

    SECTION("DI cancels a pending EI") {
        t.cpu.ime_pending = true;
        t.cpu.pc = 0x0010;
        t.program({0xF3, 0x00});
        // The pending enable is promoted before DI executes, then cleared
        t.step();
        CHECK_FALSE(t.cpu.ime);
        CHECK_FALSE(t.cpu.ime_pending);
        t.step();
        CHECK(t.cpu.pc == 0x0012);
    }
}

TEST_CASE("RETI enables interrupts immediately", "[cpu][interrupts]") {
    CpuFixture t;
    t.cpu.sp = 0xFFFC;
    t.bus.memory[0xFFFC] = 0x00;
    t.bus.memory[0xFFFD] = 0x03;
    t.program({0xD9});
    t.bus.irq.set_enable_mask(0x04);
    t.bus.irq.request(InterruptKind::Timer);

    t.step();
    CHECK(t.cpu.pc == 0x0300);
    CHECK(t.cpu.ime);

    CHECK(t.step() == 5);
    CHECK(t.cpu.pc == 0x0050);
}

TEST_CASE("HALT", "[cpu][interrupts][halt]") {
    CpuFixture t;
    t.cpu.pc = 0x0100;
    t.program({0x76, 0x3C, 0x00});
    t.bus.irq.set_enable_mask(0x04);

    SECTION("With IME set: wake and dispatch in six cycles") {
        t.cpu.ime = true;
        t.step();
        REQUIRE(t.cpu.mode == CpuMode::Halted);
        CHECK(t.step() == 1);

        t.bus.irq.request(InterruptKind::Timer);
        CHECK(t.step() == 6);
        CHECK(t.cpu.mode == CpuMode::Running);
        CHECK(t.cpu.pc == 0x0050);
        CHECK(t.bus.memory[0xFFFD] == 0x01);
        CHECK(t.bus.memory[0xFFFC] == 0x01);
    }

    SECTION("With IME clear: wake and continue, request left set") {
        t.step();
        REQUIRE(t.cpu.mode == CpuMode::Halted);

        t.bus.irq.request(InterruptKind::Timer);
        CHECK(t.step() == 1);
        CHECK(t.cpu.mode == CpuMode::Running);
        CHECK(t.cpu.a == 0x01);
        CHECK(t.cpu.pc == 0x0102);
        CHECK(requested(t.bus.irq, InterruptKind::Timer));
    }

    SECTION("Disabled requests do not wake") {
        t.step();
        t.bus.irq.request(InterruptKind::Joypad);
        CHECK(t.step() == 1);
        CHECK(t.cpu.mode == CpuMode::Halted);
    }

    SECTION("Halt bug: IME clear with a request already pending") {
        t.bus.irq.request(InterruptKind::Timer);
        t.step();
        CHECK(t.cpu.mode == CpuMode::Running);
        CHECK(t.cpu.halt_bug);

        // INC A is fetched twice
        t.step();
        CHECK(t.cpu.a == 0x01);
        CHECK(t.cpu.pc == 0x0101);
        t.step();
        CHECK(t.cpu.a == 0x02);
        CHECK(t.cpu.pc == 0x0102);
    }
}

TEST_CASE("Dispatch cancelled by a push onto IE", "[cpu][interrupts]") {
    CpuFixture t;
    t.cpu.sp = 0x0000;
    t.cpu.ime = true;
    t.bus.irq.set_enable_mask(0x01);
    t.bus.irq.request(InterruptKind::VBlank);

    SECTION("High byte clears the enabled bit") {
        t.cpu.pc = 0x0200;
        CHECK(t.step() == 5);
        CHECK(t.cpu.pc == 0x0000);
        CHECK(t.bus.irq.enable_mask() == 0x02);
        CHECK(requested(t.bus.irq, InterruptKind::VBlank));
    }

    SECTION("High byte keeps the enabled bit") {
        t.cpu.pc = 0x0100;
        CHECK(t.step() == 5);
        CHECK(t.cpu.pc == 0x0040);
        CHECK_FALSE(requested(t.bus.irq, InterruptKind::VBlank));
    }
}

TEST_CASE("STOP", "[cpu][stop]") {
    CpuFixture t;
    t.program({0x10, 0x00, 0x3C});

    t.step();
    CHECK(t.cpu.mode == CpuMode::Stopped);
    CHECK(t.cpu.pc == 0x0002);
    CHECK(t.bus.stop_count == 1);

    // Interrupt requests do not end STOP
    t.bus.irq.set_enable_mask(0x1F);
    t.bus.irq.request(InterruptKind::Timer);
    t.step();
    CHECK(t.cpu.mode == CpuMode::Stopped);

    t.bus.wake = true;
    t.step();
    CHECK(t.cpu.mode == CpuMode::Running);
    CHECK(t.cpu.a == 0x01);
    CHECK(t.cpu.pc == 0x0003);
}

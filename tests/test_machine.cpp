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
#include <gbium/Machines.hpp>

#include "TestSupport.hpp"

#include <array>
#include <stdexcept>
#include <vector>

using namespace gbium;
using gbium::test::make_rom;

namespace {

constexpr uint64_t kFirstVBlankCycle =
    timing::VISIBLE_LINES * timing::DOTS_PER_LINE / timing::DOTS_PER_MACHINE_CYCLE;

bool requested(const Dmg& machine, InterruptKind kind) {
    return (machine.read(kIfAddr) & interrupt_bit(kind)) != 0;
}

// Every I/O register plus IE, read through the debugger path
std::vector<uint8_t> read_io(const Dmg& machine) {
    std::vector<uint8_t> values;
    for (uint32_t addr = 0xFF00; addr <= 0xFF7F; ++addr) {
        values.push_back(machine.read(static_cast<uint16_t>(addr)));
    }
    values.push_back(machine.read(kIeAddr));
    return values;
}

struct DeviceSnapshot {
    uint64_t cycles;
    uint16_t timer_counter;
    uint8_t interrupt_request;
    PpuMode ppu_mode;
    uint8_t ly;
    bool dma_active;
    bool serial_transferring;
    bool boot_rom_mapped;
    uint8_t buttons;

    static DeviceSnapshot of(const Dmg& machine) {
        const auto& hw = machine.hardware();
        return DeviceSnapshot{
            machine.cycle_count(), hw.timer.counter(), hw.irq.request_mask(),
            hw.ppu.mode(), hw.ppu.ly(), hw.dma.active(), hw.serial.transferring(),
            hw.boot_rom_mapped, hw.joypad.pressed_mask()
        };
    }

    bool operator==(const DeviceSnapshot&) const = default;
};

void check_reads_are_idempotent(const Dmg& machine) {
    const auto before = DeviceSnapshot::of(machine);
    const auto first = read_io(machine);
    const auto second = read_io(machine);

    for (size_t i = 0; i < first.size(); ++i) {
        INFO("register index " << i);
        CHECK(first[i] == second[i]);
    }
    CHECK(DeviceSnapshot::of(machine) == before);
}

} // anonymous namespace

TEST_CASE("Machine I/O reads have no side effects", "[machine][io]") {
    Dmg machine;
    // LD A,$81; LDH (SC),A starts a serial transfer; then spin
    machine.load_cartridge(make_rom({0x3E, 0x81, 0xE0, 0x02, 0x18, 0xFE}));

    SECTION("Post-boot") {
        check_reads_are_idempotent(machine);
    }

    SECTION("Mid-frame with a serial transfer in flight") {
        machine.set_button(Button::Down, true);
        machine.run(1000);
        REQUIRE(machine.hardware().serial.transferring());
        check_reads_are_idempotent(machine);
    }

    SECTION("During OAM DMA") {
        machine.write(kDmaAddr, 0xC0);
        machine.step_instruction();
        REQUIRE(machine.hardware().dma.active());
        check_reads_are_idempotent(machine);
    }

    SECTION("Boot ROM still mapped") {
        std::array<uint8_t, 256> boot{};
        boot[0] = 0x18;
        boot[1] = 0xFE;
        machine.load_boot_rom(boot);
        REQUIRE(machine.hardware().boot_rom_mapped);
        check_reads_are_idempotent(machine);
        CHECK(machine.hardware().boot_rom_mapped);
    }
}

TEST_CASE("Machine post-boot state", "[machine]") {
    Dmg machine;

    CHECK(machine.pc() == 0x0100);
    CHECK(machine.sp() == 0xFFFE);
    CHECK(machine.cpu().af() == 0x01B0);
    CHECK(machine.cpu().bc() == 0x0013);
    CHECK(machine.cpu().de() == 0x00D8);
    CHECK(machine.cpu().hl() == 0x014D);
    CHECK(machine.cycle_count() == 0);

    CHECK(machine.read(kLcdcAddr) == 0x91);
    CHECK(machine.read(0xFF47) == 0xFC);
    CHECK(machine.read(kIfAddr) == 0xE1);
    CHECK(machine.read(kDivAddr) == 0xAB);
    CHECK(machine.read(kJoypadAddr) == 0xCF);
    CHECK(machine.read(0xFF26) == 0xF0);
    CHECK(machine.read(kIeAddr) == 0x00);
    CHECK_FALSE(machine.hardware().boot_rom_mapped);
}

TEST_CASE("Machine runs a frame", "[machine][frame]") {
    Dmg machine;
    machine.load_cartridge(make_rom({0x3E, 0x42, 0x76}));   // LD A,$42; HALT

    CHECK(machine.step_instruction() == 2);
    CHECK(machine.a() == 0x42);
    CHECK(machine.step_instruction() == 1);
    CHECK(machine.cpu().mode == CpuMode::Halted);

    REQUIRE(machine.run_frame());
    CHECK(machine.cycle_count() == kFirstVBlankCycle);
    CHECK(machine.hardware().ppu.ly() == 144);
    CHECK(machine.frame_buffer().version() == 1);
    CHECK(requested(machine, InterruptKind::VBlank));

    REQUIRE(machine.run_frame());
    CHECK(machine.cycle_count() == kFirstVBlankCycle + timing::CYCLES_PER_FRAME);
    CHECK(machine.frame_buffer().version() == 2);
}

TEST_CASE("Machine cartridge loading", "[machine][cartridge]") {
    Dmg machine;

    SECTION("Loading resets the machine") {
        machine.run(100);
        machine.load_cartridge(make_rom({0x00}));
        CHECK(machine.cycle_count() == 0);
        CHECK(machine.pc() == 0x0100);
        CHECK(machine.hardware().cartridge.inserted());
    }

    SECTION("Rejected images leave the machine unchanged") {
        machine.load_cartridge(make_rom({0x00}, 0x00, 0x00, 0x00, "KEEP"));
        std::vector<uint8_t> tiny(0x20, 0x00);
        CHECK_THROWS_AS(machine.load_cartridge(tiny), CartridgeError);
        CHECK(machine.hardware().cartridge.header().title == "KEEP");
    }

    SECTION("Battery RAM survives reset") {
        machine.load_cartridge(make_rom({}, 0x03, 0x00, 0x02));
        std::vector<uint8_t> image = {0x12, 0x34};
        machine.load_ram(image);
        machine.reset();
        auto saved = machine.save_ram();
        REQUIRE(saved.size() == 0x2000);
        CHECK(saved[0] == 0x12);
        CHECK(saved[1] == 0x34);
    }
}

TEST_CASE("Machine timer interrupt end to end", "[machine][interrupts]") {
    auto rom = make_rom({
        0x3E, 0x04,         // LD A,$04
        0xE0, 0xFF,         // LDH (IE),A
        0x3E, 0x05,         // LD A,$05
        0xE0, 0x07,         // LDH (TAC),A
        0xAF,               // XOR A
        0xE0, 0x05,         // LDH (TIMA),A
        0xFB,               // EI
        0x76,               // HALT
        0x18, 0xFE,         // JR -2
    });
    // Timer vector: LD A,$99; JR -2
    rom[0x0050] = 0x3E;
    rom[0x0051] = 0x99;
    rom[0x0052] = 0x18;
    rom[0x0053] = 0xFE;

    Dmg machine;
    machine.load_cartridge(rom);
    machine.run(3000);

    CHECK(machine.a() == 0x99);
    CHECK_FALSE(machine.ime());
    CHECK(machine.pc() >= 0x0052);
    CHECK(machine.pc() <= 0x0054);
}

TEST_CASE("Machine serial output", "[machine][serial]") {
    Dmg machine;
    machine.load_cartridge(make_rom({
        0x3E, 'O',          // LD A,'O'
        0xE0, 0x01,         // LDH (SB),A
        0x3E, 0x81,         // LD A,$81
        0xE0, 0x02,         // LDH (SC),A
        0x18, 0xFE,         // JR -2
    }));

    machine.run(2000);
    CHECK(machine.hardware().serial.output() == "O");
    CHECK(requested(machine, InterruptKind::Serial));
}

TEST_CASE("Machine watchpoints", "[machine][debug]") {
    Dmg machine;
    machine.load_cartridge(make_rom({
        0x3E, 0x42,         // LD A,$42
        0xEA, 0x00, 0xC0,   // LD ($C000),A
        0xFA, 0x00, 0xC0,   // LD A,($C000)
        0x76,
    }));

    struct Hit {
        uint16_t addr;
        uint8_t value;
        bool is_write;
        uint64_t cycle;
    };
    std::vector<Hit> hits;

    machine.add_watchpoint(0xC000, 1, WATCH_BOTH,
        [&](uint16_t addr, uint8_t value, bool is_write, uint64_t cycle) {
            hits.push_back({addr, value, is_write, cycle});
        });

    machine.step_instruction();
    machine.step_instruction();
    machine.step_instruction();

    REQUIRE(hits.size() == 2);
    CHECK(hits[0].addr == 0xC000);
    CHECK(hits[0].value == 0x42);
    CHECK(hits[0].is_write);
    CHECK(hits[0].cycle == 6);
    CHECK_FALSE(hits[1].is_write);

    SECTION("Cleared watchpoints stop firing") {
        machine.clear_watchpoints();
        machine.write(0xC000, 0x00);
        machine.set_pc(0x0102);
        machine.step_instruction();
        CHECK(hits.size() == 2);
    }

    SECTION("Ranges must lie inside the address space") {
        CHECK_THROWS_AS(machine.add_watchpoint(0xFFFF, 2, WATCH_READ, nullptr), std::out_of_range);
        CHECK_THROWS_AS(machine.add_watchpoint(0x1000, 0, WATCH_READ, nullptr), std::out_of_range);
    }
}

TEST_CASE("Machine instruction callback", "[machine][debug]") {
    Dmg machine;
    machine.load_cartridge(make_rom({0x00, 0x00, 0x00, 0x18, 0xFE}));

    machine.set_instruction_callback([](uint16_t pc, uint64_t) {
        return pc != 0x0102;
    });

    CHECK_FALSE(machine.run_frame());
    CHECK(machine.pc() == 0x0102);
    CHECK(machine.cycle_count() == 2);

    SECTION("step_frame ignores the callback") {
        CHECK(machine.step_frame());
        CHECK(machine.cycle_count() >= kFirstVBlankCycle);
    }

    SECTION("Clearing the callback lets the frame finish") {
        machine.clear_callbacks();
        CHECK(machine.run_frame());
    }
}

TEST_CASE("Machine pause", "[machine][debug]") {
    Dmg machine;
    machine.load_cartridge(make_rom({0x18, 0xFE}));

    const uint64_t before = machine.sequence();
    machine.pause();
    CHECK(machine.is_paused());
    CHECK(machine.sequence() > before);

    CHECK_FALSE(machine.run_frame());
    CHECK(machine.cycle_count() == 0);

    machine.resume();
    CHECK_FALSE(machine.is_paused());
    machine.wait_if_paused();
    CHECK(machine.run_frame());
}

TEST_CASE("Machine buttons", "[machine][joypad]") {
    Dmg machine;
    machine.load_cartridge(make_rom({0x00, 0x00, 0x00, 0x18, 0xFE}));

    machine.set_button(Button::Start, true);
    CHECK(machine.buttons() == 0x80);

    // Applied before the next instruction
    CHECK_FALSE(machine.hardware().joypad.is_pressed(Button::Start));
    machine.step_instruction();
    CHECK(machine.hardware().joypad.is_pressed(Button::Start));
    CHECK(requested(machine, InterruptKind::Joypad));
    CHECK(machine.read(kJoypadAddr) == 0xC7);

    machine.set_button(Button::Start, false);
    machine.step_instruction();
    CHECK_FALSE(machine.hardware().joypad.is_pressed(Button::Start));
    CHECK(machine.buttons() == 0x00);

    SECTION("Held buttons survive reset") {
        machine.set_button(Button::A, true);
        machine.reset();
        machine.step_instruction();
        CHECK(machine.hardware().joypad.is_pressed(Button::A));
    }
}

TEST_CASE("Machine STOP waits for a button", "[machine][stop]") {
    Dmg machine;
    machine.load_cartridge(make_rom({0x10, 0x00, 0x3C, 0x18, 0xFE}));   // STOP; INC A

    machine.step_instruction();
    REQUIRE(machine.cpu().mode == CpuMode::Stopped);
    CHECK(machine.hardware().timer.counter() == 0);
    CHECK(machine.pc() == 0x0102);

    machine.run(100);
    CHECK(machine.cpu().mode == CpuMode::Stopped);

    machine.set_button(Button::A, true);
    machine.step_instruction();
    CHECK(machine.cpu().mode == CpuMode::Running);
    CHECK(machine.a() == 0x02);
}

TEST_CASE("Machine STOP wakes only on a selected line", "[machine][stop]") {
    Dmg machine;
    machine.load_cartridge(make_rom({
        0x3E, 0x20,         // LD A,$20
        0xE0, 0x00,         // LDH (P1),A: direction group only
        0x10, 0x00,         // STOP
        0x3C,               // INC A
        0x18, 0xFE,
    }));

    machine.step_instruction();
    machine.step_instruction();
    machine.step_instruction();
    REQUIRE(machine.cpu().mode == CpuMode::Stopped);

    machine.set_button(Button::A, true);
    machine.run(100);
    CHECK(machine.cpu().mode == CpuMode::Stopped);
    CHECK(machine.a() == 0x20);

    machine.set_button(Button::Right, true);
    machine.step_instruction();
    CHECK(machine.cpu().mode == CpuMode::Running);
    CHECK(machine.a() == 0x21);
}

TEST_CASE("Machine audio register writes", "[machine][audio]") {
    Dmg machine;
    machine.load_cartridge(make_rom({
        0x3E, 0x77,         // LD A,$77
        0xE0, 0x24,         // LDH (NR50),A
        0x76,
    }));

    struct Write {
        uint16_t addr;
        uint8_t value;
        uint64_t cycle;
    };
    std::vector<Write> writes;
    machine.set_audio_callback([&](uint16_t addr, uint8_t value, uint64_t cycle) {
        writes.push_back({addr, value, cycle});
    });

    machine.step_instruction();
    machine.step_instruction();

    REQUIRE(writes.size() == 1);
    CHECK(writes[0].addr == 0xFF24);
    CHECK(writes[0].value == 0x77);
    CHECK(writes[0].cycle == 5);
    CHECK(machine.read(0xFF24) == 0x77);
}

TEST_CASE("Machine illegal opcode lock", "[machine][illegal]") {
    Dmg machine;
    machine.load_cartridge(make_rom({0x00, 0xED}));

    machine.step_instruction();
    CHECK_FALSE(machine.locked());
    machine.step_instruction();
    REQUIRE(machine.locked());
    REQUIRE(machine.cpu().illegal.has_value());
    CHECK(machine.cpu().illegal->opcode == 0xED);
    CHECK(machine.cpu().illegal->address == 0x0101);

    // Devices keep running
    CHECK(machine.run_frame());
    CHECK(machine.pc() == 0x0102);
}

TEST_CASE("Machine boot ROM", "[machine][boot]") {
    std::vector<uint8_t> boot(kBootRomSize, 0x00);
    // LD A,$01; LDH ($50),A; JR -2 after unmapping runs from the cartridge
    boot[0] = 0x3E;
    boot[1] = 0x01;
    boot[2] = 0xE0;
    boot[3] = 0x50;

    Dmg machine;
    machine.load_boot_rom(boot);

    CHECK(machine.pc() == 0x0000);
    CHECK(machine.cpu().af() == 0x0000);
    CHECK(machine.hardware().boot_rom_mapped);
    CHECK(machine.read(0x0000) == 0x3E);
    CHECK(machine.read(kLcdcAddr) == 0x00);

    machine.step_instruction();
    machine.step_instruction();
    CHECK_FALSE(machine.hardware().boot_rom_mapped);
    CHECK(machine.read(0x0000) == 0xFF);

    SECTION("LCD off: run_frame gives up after a frame of cycles") {
        machine.write(0xC000, 0x18);
        machine.write(0xC001, 0xFE);
        machine.set_pc(0xC000);
        CHECK_FALSE(machine.run_frame());
        CHECK(machine.cycle_count() >= timing::CYCLES_PER_FRAME);
    }

    SECTION("Reset maps the boot ROM again") {
        machine.reset();
        CHECK(machine.hardware().boot_rom_mapped);
        CHECK(machine.pc() == 0x0000);
    }
}

TEST_CASE("Machine register setters", "[machine][debug]") {
    Dmg machine;
    const uint64_t before = machine.sequence();

    machine.set_a(0x12);
    machine.set_f(0xFF);
    machine.set_h(0xC0);
    machine.set_l(0x10);
    machine.set_sp(0xD000);
    machine.set_pc(0x0200);
    machine.set_ime(true);

    CHECK(machine.a() == 0x12);
    CHECK(machine.f() == 0xF0);
    CHECK(machine.cpu().hl() == 0xC010);
    CHECK(machine.sp() == 0xD000);
    CHECK(machine.pc() == 0x0200);
    CHECK(machine.ime());
    CHECK(machine.sequence() >= before + 7);

    SECTION("Direct writes bypass the CPU bus") {
        machine.write(0xC010, 0x5A);
        CHECK(machine.read(0xC010) == 0x5A);
        CHECK(machine.peek(0xC010) == 0x5A);
        CHECK(machine.cycle_count() == 0);
    }
}

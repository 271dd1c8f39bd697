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
#include <gbium/ClockTypes.hpp>
#include <gbium/FrameBuffer.hpp>
#include <gbium/InterruptController.hpp>
#include <gbium/Ppu.hpp>
#include <gbium/Types.hpp>

#include <array>
#include <cstdint>

using namespace gbium;

namespace {

// PPU with its own VRAM, OAM and interrupt controller
struct PpuFixture {
    std::array<uint8_t, kVramSize> vram{};
    std::array<uint8_t, kOamSize> oam{};
    InterruptController irq;
    FrameBuffer frame_buffer;
    Ppu ppu;

    PpuContext context() {
        return PpuContext{vram, oam, irq, frame_buffer};
    }

    void tick(uint32_t dots) {
        const PpuContext ctx = context();
        for (uint32_t i = 0; i < dots; ++i) {
            ppu.tick(ctx);
        }
    }

    // LCD on, BG on, unsigned tile data, map at 0x9800, identity palettes
    void enable(uint8_t lcdc = 0x91) {
        ppu.write(Ppu::REG_BGP, 0xE4);
        ppu.write(Ppu::REG_OBP0, 0xE4);
        ppu.write(Ppu::REG_OBP1, 0xE4);
        ppu.write(Ppu::REG_LCDC, lcdc);
    }

    void run_to_vblank() {
        tick(timing::VISIBLE_LINES * timing::DOTS_PER_LINE);
    }

    // Fill all eight rows of an unsigned-addressed tile
    void set_tile(uint8_t tile, uint8_t low, uint8_t high) {
        for (int row = 0; row < 8; ++row) {
            vram[tile * 16 + row * 2] = low;
            vram[tile * 16 + row * 2 + 1] = high;
        }
    }

    void set_sprite(int index, uint8_t y, uint8_t x, uint8_t tile, uint8_t attributes = 0) {
        oam[index * 4 + 0] = y;
        oam[index * 4 + 1] = x;
        oam[index * 4 + 2] = tile;
        oam[index * 4 + 3] = attributes;
    }

    bool stat_requested() const {
        return (irq.request_mask() & interrupt_bit(InterruptKind::Stat)) != 0;
    }

    bool vblank_requested() const {
        return (irq.request_mask() & interrupt_bit(InterruptKind::VBlank)) != 0;
    }
};

} // anonymous namespace

TEST_CASE("PPU LCD enable", "[ppu]") {
    PpuFixture t;

    CHECK_FALSE(t.ppu.lcd_enabled());
    CHECK(t.ppu.read(Ppu::REG_STAT) == 0x84);   // LY == LYC, mode bits 0

    t.enable();
    CHECK(t.ppu.lcd_enabled());
    CHECK(t.ppu.mode() == PpuMode::OamScan);
    CHECK(t.ppu.ly() == 0);
    CHECK((t.ppu.read(Ppu::REG_STAT) & 0x03) == 2);

    SECTION("Disabling resets LY and reports mode 0") {
        t.tick(1000);
        REQUIRE(t.ppu.ly() == 2);
        t.ppu.write(Ppu::REG_LCDC, 0x11);
        CHECK(t.ppu.ly() == 0);
        CHECK(t.ppu.mode() == PpuMode::HBlank);
        CHECK((t.ppu.read(Ppu::REG_STAT) & 0x03) == 0);

        t.tick(1000);
        CHECK(t.ppu.ly() == 0);
        CHECK(t.ppu.dot() == 0);
    }
}

TEST_CASE("PPU register access", "[ppu]") {
    PpuFixture t;

    t.ppu.write(Ppu::REG_SCY, 0x12);
    t.ppu.write(Ppu::REG_SCX, 0x34);
    t.ppu.write(Ppu::REG_WY, 0x56);
    t.ppu.write(Ppu::REG_WX, 0x78);
    CHECK(t.ppu.read(Ppu::REG_SCY) == 0x12);
    CHECK(t.ppu.read(Ppu::REG_SCX) == 0x34);
    CHECK(t.ppu.read(Ppu::REG_WY) == 0x56);
    CHECK(t.ppu.read(Ppu::REG_WX) == 0x78);

    // LY is read-only; STAT keeps only its interrupt select bits
    t.ppu.write(Ppu::REG_LY, 0x40);
    CHECK(t.ppu.read(Ppu::REG_LY) == 0x00);
    t.ppu.write(Ppu::REG_STAT, 0xFF);
    CHECK(t.ppu.read(Ppu::REG_STAT) == 0xFC);
}

TEST_CASE("PPU line timing", "[ppu][timing]") {
    PpuFixture t;
    t.enable();

    SECTION("OAM scan lasts 80 dots") {
        t.tick(79);
        CHECK(t.ppu.mode() == PpuMode::OamScan);
        t.tick(1);
        CHECK(t.ppu.mode() == PpuMode::PixelTransfer);
    }

    SECTION("Pixel transfer lasts 172 dots with SCX 0") {
        t.tick(80 + 171);
        CHECK(t.ppu.mode() == PpuMode::PixelTransfer);
        t.tick(1);
        CHECK(t.ppu.mode() == PpuMode::HBlank);
        CHECK(t.ppu.last_transfer_dots() == 172);
    }

    SECTION("Fine scroll lengthens pixel transfer") {
        t.ppu.write(Ppu::REG_SCX, 0x03);
        t.tick(timing::DOTS_PER_LINE);
        CHECK(t.ppu.last_transfer_dots() == 175);
    }

    SECTION("Coarse scroll does not") {
        t.ppu.write(Ppu::REG_SCX, 0x08);
        t.tick(timing::DOTS_PER_LINE);
        CHECK(t.ppu.last_transfer_dots() == 172);
    }

    SECTION("Lines are 456 dots") {
        t.tick(timing::DOTS_PER_LINE - 1);
        CHECK(t.ppu.ly() == 0);
        CHECK(t.ppu.mode() == PpuMode::HBlank);
        t.tick(1);
        CHECK(t.ppu.ly() == 1);
        CHECK(t.ppu.mode() == PpuMode::OamScan);
    }
}

TEST_CASE("PPU VBlank", "[ppu][vblank]") {
    PpuFixture t;
    t.enable();

    t.tick(timing::VISIBLE_LINES * timing::DOTS_PER_LINE - 1);
    CHECK(t.ppu.ly() == 143);
    CHECK_FALSE(t.vblank_requested());
    CHECK_FALSE(t.ppu.frame_ready());

    t.tick(1);
    CHECK(t.ppu.ly() == 144);
    CHECK(t.ppu.mode() == PpuMode::VBlank);
    CHECK(t.vblank_requested());
    CHECK(t.frame_buffer.version() == 1);
    CHECK(t.ppu.take_frame_ready());
    CHECK_FALSE(t.ppu.frame_ready());

    SECTION("VBlank lines keep VRAM and OAM open") {
        CHECK(t.ppu.vram_accessible());
        CHECK(t.ppu.oam_accessible());
    }

    SECTION("Frame wraps to line 0 after 154 lines") {
        t.tick(10 * timing::DOTS_PER_LINE - 1);
        CHECK(t.ppu.ly() == 153);
        CHECK(t.ppu.mode() == PpuMode::VBlank);
        t.tick(1);
        CHECK(t.ppu.ly() == 0);
        CHECK(t.ppu.mode() == PpuMode::OamScan);
    }
}

TEST_CASE("PPU CPU access blocking", "[ppu]") {
    PpuFixture t;

    CHECK(t.ppu.vram_accessible());
    CHECK(t.ppu.oam_accessible());

    t.enable();
    // Mode 2: OAM closed
    CHECK(t.ppu.vram_accessible());
    CHECK_FALSE(t.ppu.oam_accessible());

    // Mode 3: both closed
    t.tick(100);
    REQUIRE(t.ppu.mode() == PpuMode::PixelTransfer);
    CHECK_FALSE(t.ppu.vram_accessible());
    CHECK_FALSE(t.ppu.oam_accessible());

    // Mode 0: both open
    t.tick(200);
    REQUIRE(t.ppu.mode() == PpuMode::HBlank);
    CHECK(t.ppu.vram_accessible());
    CHECK(t.ppu.oam_accessible());
}

TEST_CASE("PPU STAT interrupt", "[ppu][stat]") {
    PpuFixture t;

    SECTION("LY=LYC coincidence") {
        t.ppu.write(Ppu::REG_LYC, 2);
        t.ppu.write(Ppu::REG_STAT, 0x40);
        t.enable();

        t.tick(2 * timing::DOTS_PER_LINE - 1);
        CHECK_FALSE(t.stat_requested());
        CHECK((t.ppu.read(Ppu::REG_STAT) & 0x04) == 0);

        t.tick(1);
        CHECK(t.ppu.ly() == 2);
        CHECK(t.stat_requested());
        CHECK((t.ppu.read(Ppu::REG_STAT) & 0x04) != 0);
    }

    SECTION("Requested on the rising edge of the combined line only") {
        t.ppu.write(Ppu::REG_STAT, 0x28);   // HBlank and OAM sources
        t.enable();

        t.tick(1);
        CHECK(t.stat_requested());
        t.irq.acknowledge(InterruptKind::Stat);

        // Mode 3 drops the line; HBlank raises it again
        t.tick(80 + 172 - 1);
        CHECK(t.ppu.mode() == PpuMode::HBlank);
        CHECK(t.stat_requested());
        t.irq.acknowledge(InterruptKind::Stat);

        // HBlank into the next OAM scan: the line stays high
        t.tick(timing::DOTS_PER_LINE - 252);
        CHECK(t.ppu.mode() == PpuMode::OamScan);
        CHECK(t.ppu.ly() == 1);
        CHECK_FALSE(t.stat_requested());
    }

    SECTION("VBlank source") {
        t.ppu.write(Ppu::REG_STAT, 0x10);
        t.enable();
        t.run_to_vblank();
        CHECK(t.stat_requested());
    }
}

TEST_CASE("PPU background rendering", "[ppu][render]") {
    PpuFixture t;

    // Tile 0 everywhere: pixels 0-3 colour 3, pixels 4-7 colour 2
    t.set_tile(0, 0xF0, 0xFF);

    SECTION("Unscrolled") {
        t.enable();
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 3);
        CHECK(t.frame_buffer.pixel(4, 0) == 2);
        CHECK(t.frame_buffer.pixel(8, 0) == 3);
        CHECK(t.frame_buffer.pixel(159, 143) == 2);
    }

    SECTION("Fine horizontal scroll") {
        t.ppu.write(Ppu::REG_SCX, 4);
        t.enable();
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 2);
        CHECK(t.frame_buffer.pixel(4, 0) == 3);
    }

    SECTION("Palette maps colours to shades") {
        t.enable();
        t.ppu.write(Ppu::REG_BGP, 0x1B);   // Reversed ramp
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 10) == 0);
        CHECK(t.frame_buffer.pixel(4, 10) == 1);
    }

    SECTION("Background disabled renders colour 0") {
        t.enable(0x90);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 0);
    }
}

TEST_CASE("PPU signed tile addressing", "[ppu][render]") {
    PpuFixture t;

    // Tile 0x80 in 0x8800 mode lives at 0x8800; tile 0 at 0x9000
    for (int row = 0; row < 8; ++row) {
        t.vram[0x0800 + row * 2] = 0xFF;       // Tile 0x80: colour 1
        t.vram[0x1000 + row * 2 + 1] = 0xFF;   // Tile 0x00: colour 2
    }
    t.vram[0x1800] = 0x80;   // First map entry

    t.enable(0x81);
    t.run_to_vblank();
    CHECK(t.frame_buffer.pixel(0, 0) == 1);
    CHECK(t.frame_buffer.pixel(8, 0) == 2);
}

TEST_CASE("PPU window", "[ppu][window]") {
    PpuFixture t;

    // Window map at 0x9C00 uses tile 1 (colour 3), background stays colour 0
    t.set_tile(1, 0xFF, 0xFF);
    for (int i = 0; i < 0x400; ++i) {
        t.vram[0x1C00 + i] = 0x01;
    }

    SECTION("Window covering the screen") {
        t.ppu.write(Ppu::REG_WY, 0);
        t.ppu.write(Ppu::REG_WX, 7);
        t.enable(0xF1);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 3);
        CHECK(t.frame_buffer.pixel(159, 143) == 3);
    }

    SECTION("Window starting mid-line and mid-frame") {
        t.ppu.write(Ppu::REG_WY, 10);
        t.ppu.write(Ppu::REG_WX, 87);
        t.enable(0xF1);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(100, 9) == 0);
        CHECK(t.frame_buffer.pixel(79, 10) == 0);
        CHECK(t.frame_buffer.pixel(80, 10) == 3);
        CHECK(t.frame_buffer.pixel(159, 143) == 3);
    }

    SECTION("Window disabled in LCDC") {
        t.ppu.write(Ppu::REG_WY, 0);
        t.ppu.write(Ppu::REG_WX, 7);
        t.enable(0xD1);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 0);
    }
}

TEST_CASE("PPU sprites", "[ppu][sprites]") {
    PpuFixture t;
    t.set_tile(1, 0xFF, 0xFF);   // Colour 3
    t.set_tile(2, 0xFF, 0x00);   // Colour 1

    SECTION("Sprite drawn over colour 0 background") {
        t.set_sprite(0, 16, 8, 1);
        t.enable(0x93);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 3);
        CHECK(t.frame_buffer.pixel(7, 7) == 3);
        CHECK(t.frame_buffer.pixel(8, 0) == 0);
        CHECK(t.frame_buffer.pixel(0, 8) == 0);
    }

    SECTION("Sprites hidden when OBJ is disabled") {
        t.set_sprite(0, 16, 8, 1);
        t.enable(0x91);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 0);
    }

    SECTION("OBP1 selected by attribute bit 4") {
        t.set_sprite(0, 16, 8, 2, 0x10);
        t.ppu.write(Ppu::REG_OBP1, 0x0C);   // Colour 1 -> shade 3
        t.ppu.write(Ppu::REG_LCDC, 0x93);
        t.ppu.write(Ppu::REG_BGP, 0xE4);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 3);
    }

    SECTION("Smaller X wins where sprites overlap") {
        t.set_sprite(0, 16, 12, 1);   // Screen x 4-11, colour 3
        t.set_sprite(1, 16, 8, 2);    // Screen x 0-7, colour 1
        t.enable(0x93);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 1);
        CHECK(t.frame_buffer.pixel(5, 0) == 1);
        CHECK(t.frame_buffer.pixel(9, 0) == 3);
    }

    SECTION("Equal X: lower OAM index wins") {
        t.set_sprite(0, 16, 8, 2);
        t.set_sprite(1, 16, 8, 1);
        t.enable(0x93);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(3, 0) == 1);
    }

    SECTION("Behind-background sprites show only over colour 0") {
        t.set_tile(0, 0xF0, 0x00);   // Background colour 1 on pixels 0-3
        t.set_sprite(0, 16, 8, 1, 0x80);
        t.enable(0x93);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 1);
        CHECK(t.frame_buffer.pixel(4, 0) == 3);
    }

    SECTION("Priority-clear sprites cover a non-zero background") {
        t.set_tile(0, 0xFF, 0x00);   // Background colour 1 everywhere
        t.set_tile(3, 0x0F, 0x0F);   // Sprite colour 0 on pixels 0-3, colour 3 on 4-7
        t.set_sprite(0, 16, 8, 1);
        t.set_sprite(1, 16, 16, 3);
        t.enable(0x93);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 3);
        CHECK(t.frame_buffer.pixel(7, 7) == 3);
        CHECK(t.frame_buffer.pixel(8, 0) == 1);    // Transparent sprite pixel
        CHECK(t.frame_buffer.pixel(12, 0) == 3);
        CHECK(t.frame_buffer.pixel(16, 0) == 1);   // Past both sprites
    }

    SECTION("Horizontal flip") {
        t.vram[0x30] = 0x80;   // Tile 3 row 0: leftmost pixel colour 1
        t.set_sprite(0, 16, 8, 3, 0x20);
        t.enable(0x93);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 0);
        CHECK(t.frame_buffer.pixel(7, 0) == 1);
    }

    SECTION("Ten sprites per line") {
        for (int i = 0; i < 12; ++i) {
            t.set_sprite(i, 16, static_cast<uint8_t>(8 + i * 8), 1);
        }
        t.enable(0x93);
        t.tick(80);
        CHECK(t.ppu.line_sprite_count() == 10);

        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(72, 0) == 3);
        CHECK(t.frame_buffer.pixel(80, 0) == 0);
    }

    SECTION("Each sprite fetch stalls pixel transfer") {
        t.set_sprite(0, 16, 8, 1);
        t.enable(0x93);
        t.tick(timing::DOTS_PER_LINE);
        CHECK(t.ppu.last_transfer_dots() == 172 + Ppu::kSpriteFetchDots);
    }

    SECTION("8x16 sprites ignore tile bit 0") {
        t.set_tile(4, 0x00, 0x00);
        t.set_tile(5, 0xFF, 0xFF);
        t.set_sprite(0, 16, 8, 5);
        t.enable(0x97);
        t.run_to_vblank();
        CHECK(t.frame_buffer.pixel(0, 0) == 0);    // Top half: tile 4
        CHECK(t.frame_buffer.pixel(0, 8) == 3);    // Bottom half: tile 5
        CHECK(t.frame_buffer.pixel(0, 16) == 0);
    }
}

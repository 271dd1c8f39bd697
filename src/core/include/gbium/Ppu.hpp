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

#ifndef GBIUM_PPU_HPP
#define GBIUM_PPU_HPP

#include "ClockTypes.hpp"
#include "FrameBuffer.hpp"
#include "InterruptController.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace gbium {

enum class PpuMode : uint8_t {
    HBlank        = 0,
    VBlank        = 1,
    OamScan       = 2,
    PixelTransfer = 3,
};

inline const char* ppu_mode_name(PpuMode mode) {
    switch (mode) {
        case PpuMode::HBlank:        return "hblank";
        case PpuMode::VBlank:        return "vblank";
        case PpuMode::OamScan:       return "oam_scan";
        case PpuMode::PixelTransfer: return "pixel_transfer";
    }
    return "unknown";
}

// Everything the PPU touches outside its own registers, passed per tick
struct PpuContext {
    std::span<const uint8_t> vram;   // 8KB at 0x8000
    std::span<const uint8_t> oam;    // 160 bytes at 0xFE00
    InterruptController& irq;
    FrameBuffer& frame_buffer;
};

// DMG pixel processing unit (registers 0xFF40-0xFF4B, DMA excepted).
//
// Each scanline is 456 dots:
//   Mode 2 (OAM scan)       dots 0-79, one OAM entry every two dots,
//                           up to 10 sprites kept in OAM order
//   Mode 3 (pixel transfer) 172 dots minimum: 6-dot discarded fetch,
//                           6-dot first tile, 160 pixels. Lengthened by
//                           SCX & 7, a 6-dot window restart and
//                           sprite fetches
//   Mode 0 (HBlank)         pads the line to 456 dots
// Lines 144-153 are mode 1 (VBlank). VBlank is requested on entry to 144.
//
// Pixel transfer runs a background/window fetcher (tile number, data low,
// data high at two dots each, then push when the FIFO is empty) feeding an
// 8-pixel FIFO, with a sprite FIFO aligned to the output position.
// SCY, SCX, WX and the palettes are latched when pixel transfer starts.
class Ppu {
public:
    // Dots a sprite fetch stalls the pixel pipeline once the current
    // background tile has been pushed
    static constexpr uint32_t kSpriteFetchDots = 6;
    static constexpr uint32_t kMaxSpritesPerLine = 10;

    Ppu();

    void reset();

    // Register access (offsets 0x00-0x0B from 0xFF40)
    // Satisfies MemoryMappedDevice concept; reads have no side effects
    uint8_t read(uint16_t offset) const;
    void write(uint16_t offset, uint8_t value);

    // Advance one dot
    void tick(const PpuContext& ctx);

    // CPU access blocking
    bool vram_accessible() const;
    bool oam_accessible() const;

    // Set at VBlank entry; take_frame_ready() clears it
    bool frame_ready() const { return frame_ready_; }
    bool take_frame_ready() {
        bool ready = frame_ready_;
        frame_ready_ = false;
        return ready;
    }

    bool lcd_enabled() const { return (lcdc_ & 0x80) != 0; }
    PpuMode mode() const { return mode_; }
    uint8_t ly() const { return ly_; }
    uint16_t dot() const { return dot_; }
    uint8_t window_line() const { return window_line_; }
    uint32_t line_sprite_count() const { return sprite_count_; }

    // Length of the most recent mode 3, in dots
    uint32_t last_transfer_dots() const { return last_transfer_dots_; }

    // Register offsets
    static constexpr uint8_t REG_LCDC = 0x00;
    static constexpr uint8_t REG_STAT = 0x01;
    static constexpr uint8_t REG_SCY  = 0x02;
    static constexpr uint8_t REG_SCX  = 0x03;
    static constexpr uint8_t REG_LY   = 0x04;
    static constexpr uint8_t REG_LYC  = 0x05;
    static constexpr uint8_t REG_DMA  = 0x06;   // Decoded by OamDma
    static constexpr uint8_t REG_BGP  = 0x07;
    static constexpr uint8_t REG_OBP0 = 0x08;
    static constexpr uint8_t REG_OBP1 = 0x09;
    static constexpr uint8_t REG_WY   = 0x0A;
    static constexpr uint8_t REG_WX   = 0x0B;

private:
    enum class FetchStep : uint8_t { TileNumber, DataLow, DataHigh, Push };

    struct Sprite {
        uint8_t y;
        uint8_t x;
        uint8_t tile;
        uint8_t attributes;
        bool fetched;
    };

    struct SpritePixel {
        uint8_t color = 0;       // 0 = transparent / empty slot
        uint8_t palette = 0;     // 0 = OBP0, 1 = OBP1
        bool behind_bg = false;  // Attribute bit 7
    };

    // Registers
    uint8_t lcdc_ = 0x00;
    uint8_t stat_ = 0x00;        // Bits 6-3 only
    uint8_t scy_ = 0x00;
    uint8_t scx_ = 0x00;
    uint8_t lyc_ = 0x00;
    uint8_t bgp_ = 0x00;
    uint8_t obp0_ = 0x00;
    uint8_t obp1_ = 0x00;
    uint8_t wy_ = 0x00;
    uint8_t wx_ = 0x00;

    // Timing
    PpuMode mode_ = PpuMode::HBlank;
    uint8_t ly_ = 0;
    uint16_t dot_ = 0;
    bool stat_line_ = false;
    bool frame_ready_ = false;

    // Window
    bool window_y_triggered_ = false;
    bool window_drawn_ = false;
    uint8_t window_line_ = 0;

    // OAM scan results
    std::array<Sprite, kMaxSpritesPerLine> sprites_{};
    uint32_t sprite_count_ = 0;

    // Values latched at the start of pixel transfer
    uint8_t latched_scy_ = 0;
    uint8_t latched_scx_ = 0;
    uint8_t latched_wx_ = 0;
    uint8_t latched_bgp_ = 0;
    uint8_t latched_obp0_ = 0;
    uint8_t latched_obp1_ = 0;

    // Pixel pipeline
    FetchStep fetch_step_ = FetchStep::TileNumber;
    uint8_t fetch_dots_ = 0;
    uint8_t fetcher_x_ = 0;
    uint8_t fetch_tile_ = 0;
    uint8_t fetch_low_ = 0;
    uint8_t fetch_high_ = 0;
    bool fetching_window_ = false;
    bool discard_next_push_ = false;

    std::array<uint8_t, 8> bg_fifo_{};
    uint8_t bg_fifo_size_ = 0;
    uint8_t bg_fifo_head_ = 0;

    std::array<SpritePixel, 8> sprite_fifo_{};
    uint32_t sprite_fetch_remaining_ = 0;
    uint32_t sprite_fetch_index_ = 0;

    uint8_t lx_ = 0;             // Pixels output on this line
    uint8_t discard_ = 0;        // Pixels still to drop (SCX & 7, WX < 7)
    uint16_t transfer_start_dot_ = 0;
    uint32_t last_transfer_dots_ = 0;
    std::array<uint8_t, video_constants::FRAME_WIDTH> row_{};

    void begin_line();
    void next_line(const PpuContext& ctx);
    void scan_oam_entry(uint32_t index, std::span<const uint8_t> oam);
    void start_transfer();
    void transfer_dot(const PpuContext& ctx);
    void finish_transfer(const PpuContext& ctx);

    void fetcher_dot(std::span<const uint8_t> vram);
    void try_push();
    uint8_t fetch_row() const;
    uint8_t fetch_tile_data(std::span<const uint8_t> vram, bool high) const;
    bool window_should_start() const;
    void start_window();
    int next_sprite_index() const;
    void merge_sprite(const Sprite& sprite, std::span<const uint8_t> vram);
    void output_pixel();

    void update_stat_line(InterruptController& irq);
    uint8_t sprite_height() const { return (lcdc_ & 0x04) ? 16 : 8; }
};

// Clock binding glue: the PPU runs every dot
struct VideoBinding {
    Ppu& ppu;
    PpuContext context;

    static constexpr ClockRate clock_rate = ClockRate::Dot;

    void tick() { ppu.tick(context); }
};

} // namespace gbium

#endif // GBIUM_PPU_HPP

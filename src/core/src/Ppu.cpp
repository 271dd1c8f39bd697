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

#include <gbium/Ppu.hpp>

namespace gbium {

namespace {

constexpr uint16_t kTileMap0 = 0x1800;   // 0x9800 relative to VRAM
constexpr uint16_t kTileMap1 = 0x1C00;   // 0x9C00
constexpr uint16_t kSignedTileBase = 0x1000;  // 0x9000, tile numbers are int8_t

constexpr uint8_t kLcdcBgEnable     = 0x01;
constexpr uint8_t kLcdcObjEnable    = 0x02;
constexpr uint8_t kLcdcBgMap        = 0x08;
constexpr uint8_t kLcdcTileData     = 0x10;
constexpr uint8_t kLcdcWindowEnable = 0x20;
constexpr uint8_t kLcdcWindowMap    = 0x40;

constexpr uint8_t kStatHBlank = 0x08;
constexpr uint8_t kStatVBlank = 0x10;
constexpr uint8_t kStatOam    = 0x20;
constexpr uint8_t kStatLyc    = 0x40;

constexpr uint8_t kAttrPalette  = 0x10;
constexpr uint8_t kAttrXFlip    = 0x20;
constexpr uint8_t kAttrYFlip    = 0x40;
constexpr uint8_t kAttrBehindBg = 0x80;

constexpr uint16_t kOamScanDots = 80;

uint8_t apply_palette(uint8_t palette, uint8_t color) {
    return (palette >> (color * 2)) & 0x03;
}

} // anonymous namespace

Ppu::Ppu() {
    reset();
}

void Ppu::reset() {
    lcdc_ = 0x00;
    stat_ = 0x00;
    scy_ = scx_ = 0x00;
    lyc_ = 0x00;
    bgp_ = obp0_ = obp1_ = 0x00;
    wy_ = wx_ = 0x00;

    mode_ = PpuMode::HBlank;
    ly_ = 0;
    dot_ = 0;
    stat_line_ = false;
    frame_ready_ = false;

    window_y_triggered_ = false;
    window_drawn_ = false;
    window_line_ = 0;

    sprite_count_ = 0;
    sprite_fetch_remaining_ = 0;
    bg_fifo_size_ = 0;
    bg_fifo_head_ = 0;
    sprite_fifo_.fill(SpritePixel{});
    lx_ = 0;
    discard_ = 0;
    last_transfer_dots_ = 0;
}

//////////////////////////////////////////////////////////////////////////////
// Register access
//////////////////////////////////////////////////////////////////////////////

uint8_t Ppu::read(uint16_t offset) const {
    switch (offset) {
    case REG_LCDC:
        return lcdc_;
    case REG_STAT: {
        uint8_t value = static_cast<uint8_t>(0x80 | (stat_ & 0x78));
        if (ly_ == lyc_) {
            value |= 0x04;
        }
        if (lcd_enabled()) {
            value |= static_cast<uint8_t>(mode_);
        }
        return value;
    }
    case REG_SCY:  return scy_;
    case REG_SCX:  return scx_;
    case REG_LY:   return ly_;
    case REG_LYC:  return lyc_;
    case REG_BGP:  return bgp_;
    case REG_OBP0: return obp0_;
    case REG_OBP1: return obp1_;
    case REG_WY:   return wy_;
    case REG_WX:   return wx_;
    default:
        return 0xFF;
    }
}

void Ppu::write(uint16_t offset, uint8_t value) {
    switch (offset) {
    case REG_LCDC: {
        const bool was_enabled = lcd_enabled();
        lcdc_ = value;
        if (was_enabled && !lcd_enabled()) {
            ly_ = 0;
            dot_ = 0;
            mode_ = PpuMode::HBlank;
            stat_line_ = false;
            window_y_triggered_ = false;
            window_line_ = 0;
        } else if (!was_enabled && lcd_enabled()) {
            ly_ = 0;
            dot_ = 0;
            begin_line();
        }
        break;
    }
    case REG_STAT: stat_ = value & 0x78; break;
    case REG_SCY:  scy_ = value; break;
    case REG_SCX:  scx_ = value; break;
    case REG_LY:   break;   // Read-only
    case REG_LYC:  lyc_ = value; break;
    case REG_BGP:  bgp_ = value; break;
    case REG_OBP0: obp0_ = value; break;
    case REG_OBP1: obp1_ = value; break;
    case REG_WY:   wy_ = value; break;
    case REG_WX:   wx_ = value; break;
    default:
        break;
    }
}

bool Ppu::vram_accessible() const {
    return !lcd_enabled() || mode_ != PpuMode::PixelTransfer;
}

bool Ppu::oam_accessible() const {
    return !lcd_enabled() ||
           (mode_ != PpuMode::OamScan && mode_ != PpuMode::PixelTransfer);
}

//////////////////////////////////////////////////////////////////////////////
// Line sequencing
//////////////////////////////////////////////////////////////////////////////

void Ppu::tick(const PpuContext& ctx) {
    if (!lcd_enabled()) {
        return;
    }

    switch (mode_) {
    case PpuMode::OamScan:
        if ((dot_ & 1) == 0) {
            scan_oam_entry(dot_ / 2, ctx.oam);
        }
        if (dot_ == kOamScanDots - 1) {
            start_transfer();
        }
        break;
    case PpuMode::PixelTransfer:
        transfer_dot(ctx);
        break;
    case PpuMode::HBlank:
    case PpuMode::VBlank:
        break;
    }

    if (++dot_ == timing::DOTS_PER_LINE) {
        dot_ = 0;
        next_line(ctx);
    }

    update_stat_line(ctx.irq);
}

void Ppu::begin_line() {
    mode_ = PpuMode::OamScan;
    sprite_count_ = 0;
    window_drawn_ = false;
    if (ly_ == wy_) {
        window_y_triggered_ = true;
    }
}

void Ppu::next_line(const PpuContext& ctx) {
    if (window_drawn_) {
        ++window_line_;
    }

    ++ly_;
    if (ly_ == timing::VISIBLE_LINES) {
        mode_ = PpuMode::VBlank;
        window_drawn_ = false;
        ctx.irq.request(InterruptKind::VBlank);
        ctx.frame_buffer.swap();
        frame_ready_ = true;
    } else if (ly_ == timing::LINES_PER_FRAME) {
        ly_ = 0;
        window_line_ = 0;
        window_y_triggered_ = false;
        begin_line();
    } else if (ly_ < timing::VISIBLE_LINES) {
        begin_line();
    }
}

void Ppu::update_stat_line(InterruptController& irq) {
    bool line = false;
    switch (mode_) {
    case PpuMode::HBlank:  line = (stat_ & kStatHBlank) != 0; break;
    case PpuMode::VBlank:  line = (stat_ & kStatVBlank) != 0; break;
    case PpuMode::OamScan: line = (stat_ & kStatOam) != 0; break;
    case PpuMode::PixelTransfer: break;
    }
    if ((stat_ & kStatLyc) && ly_ == lyc_) {
        line = true;
    }

    if (line && !stat_line_) {
        irq.request(InterruptKind::Stat);
    }
    stat_line_ = line;
}

//////////////////////////////////////////////////////////////////////////////
// Mode 2: OAM scan
//////////////////////////////////////////////////////////////////////////////

void Ppu::scan_oam_entry(uint32_t index, std::span<const uint8_t> oam) {
    if (sprite_count_ >= kMaxSpritesPerLine) {
        return;
    }
    const size_t base = index * 4;
    const uint8_t y = oam[base];
    const int top = static_cast<int>(y) - 16;
    const int line = ly_;
    if (line >= top && line < top + sprite_height()) {
        sprites_[sprite_count_++] = Sprite{
            y, oam[base + 1], oam[base + 2], oam[base + 3], false
        };
    }
}

//////////////////////////////////////////////////////////////////////////////
// Mode 3: pixel transfer
//////////////////////////////////////////////////////////////////////////////

void Ppu::start_transfer() {
    mode_ = PpuMode::PixelTransfer;
    transfer_start_dot_ = kOamScanDots;

    latched_scy_ = scy_;
    latched_scx_ = scx_;
    latched_wx_ = wx_;
    latched_bgp_ = bgp_;
    latched_obp0_ = obp0_;
    latched_obp1_ = obp1_;

    fetch_step_ = FetchStep::TileNumber;
    fetch_dots_ = 0;
    fetcher_x_ = 0;
    fetching_window_ = false;
    discard_next_push_ = true;   // First fetch of the line is thrown away

    bg_fifo_size_ = 0;
    bg_fifo_head_ = 0;
    sprite_fifo_.fill(SpritePixel{});
    sprite_fetch_remaining_ = 0;

    lx_ = 0;
    discard_ = latched_scx_ & 0x07;
}

void Ppu::transfer_dot(const PpuContext& ctx) {
    if (sprite_fetch_remaining_ == 0) {
        const int index = next_sprite_index();
        if (index >= 0 && bg_fifo_size_ > 0) {
            sprite_fetch_index_ = static_cast<uint32_t>(index);
            sprite_fetch_remaining_ = kSpriteFetchDots;
        }
    }

    if (sprite_fetch_remaining_ > 0) {
        if (--sprite_fetch_remaining_ == 0) {
            Sprite& sprite = sprites_[sprite_fetch_index_];
            merge_sprite(sprite, ctx.vram);
            sprite.fetched = true;
        }
        return;
    }

    // Shifter runs before the fetcher, so a tile pushed this dot is
    // shifted out from the next one
    output_pixel();
    if (lx_ == video_constants::FRAME_WIDTH) {
        finish_transfer(ctx);
        return;
    }
    fetcher_dot(ctx.vram);
}

void Ppu::finish_transfer(const PpuContext& ctx) {
    ctx.frame_buffer.write_row(ly_, row_);
    last_transfer_dots_ = static_cast<uint32_t>(dot_ + 1 - transfer_start_dot_);
    mode_ = PpuMode::HBlank;
}

void Ppu::output_pixel() {
    if (bg_fifo_size_ == 0) {
        return;
    }

    if (window_should_start()) {
        start_window();
        return;
    }

    const uint8_t bg = bg_fifo_[bg_fifo_head_++];
    --bg_fifo_size_;

    if (discard_ > 0) {
        --discard_;
        return;
    }

    SpritePixel& slot = sprite_fifo_[lx_ & 0x07];
    const SpritePixel sprite = slot;
    slot = SpritePixel{};

    const uint8_t bg_color = (lcdc_ & kLcdcBgEnable) ? bg : 0;
    uint8_t shade;
    if (sprite.color != 0 && (!sprite.behind_bg || bg_color == 0)) {
        shade = apply_palette(sprite.palette ? latched_obp1_ : latched_obp0_, sprite.color);
    } else {
        shade = apply_palette(latched_bgp_, bg_color);
    }
    row_[lx_++] = shade;
}

//////////////////////////////////////////////////////////////////////////////
// Background / window fetcher
//////////////////////////////////////////////////////////////////////////////

void Ppu::fetcher_dot(std::span<const uint8_t> vram) {
    switch (fetch_step_) {
    case FetchStep::TileNumber:
        if (++fetch_dots_ == 2) {
            uint16_t map;
            uint8_t tile_x;
            uint8_t tile_y;
            if (fetching_window_) {
                map = (lcdc_ & kLcdcWindowMap) ? kTileMap1 : kTileMap0;
                tile_x = fetcher_x_ & 0x1F;
                tile_y = window_line_ >> 3;
            } else {
                map = (lcdc_ & kLcdcBgMap) ? kTileMap1 : kTileMap0;
                tile_x = static_cast<uint8_t>((latched_scx_ >> 3) + fetcher_x_) & 0x1F;
                tile_y = static_cast<uint8_t>(ly_ + latched_scy_) >> 3;
            }
            fetch_tile_ = vram[map + tile_y * 32 + tile_x];
            fetch_step_ = FetchStep::DataLow;
            fetch_dots_ = 0;
        }
        break;

    case FetchStep::DataLow:
        if (++fetch_dots_ == 2) {
            fetch_low_ = fetch_tile_data(vram, false);
            fetch_step_ = FetchStep::DataHigh;
            fetch_dots_ = 0;
        }
        break;

    case FetchStep::DataHigh:
        if (++fetch_dots_ == 2) {
            fetch_high_ = fetch_tile_data(vram, true);
            fetch_step_ = FetchStep::Push;
            fetch_dots_ = 0;
            try_push();
        }
        break;

    case FetchStep::Push:
        try_push();
        break;
    }
}

void Ppu::try_push() {
    if (bg_fifo_size_ != 0) {
        return;
    }

    fetch_step_ = FetchStep::TileNumber;
    if (discard_next_push_) {
        discard_next_push_ = false;
        return;
    }

    for (uint8_t i = 0; i < 8; ++i) {
        const uint8_t bit = 7 - i;
        bg_fifo_[i] = static_cast<uint8_t>((((fetch_high_ >> bit) & 1) << 1) |
                                           ((fetch_low_ >> bit) & 1));
    }
    bg_fifo_head_ = 0;
    bg_fifo_size_ = 8;
    ++fetcher_x_;
}

uint8_t Ppu::fetch_row() const {
    if (fetching_window_) {
        return window_line_ & 0x07;
    }
    return static_cast<uint8_t>(ly_ + latched_scy_) & 0x07;
}

uint8_t Ppu::fetch_tile_data(std::span<const uint8_t> vram, bool high) const {
    uint16_t address;
    if (lcdc_ & kLcdcTileData) {
        address = static_cast<uint16_t>(fetch_tile_ * 16);
    } else {
        address = static_cast<uint16_t>(kSignedTileBase +
                                        static_cast<int8_t>(fetch_tile_) * 16);
    }
    address = static_cast<uint16_t>(address + fetch_row() * 2 + (high ? 1 : 0));
    return vram[address];
}

//////////////////////////////////////////////////////////////////////////////
// Window
//////////////////////////////////////////////////////////////////////////////

bool Ppu::window_should_start() const {
    return !fetching_window_ &&
           (lcdc_ & kLcdcWindowEnable) != 0 &&
           window_y_triggered_ &&
           lx_ + 7 >= latched_wx_;
}

void Ppu::start_window() {
    fetching_window_ = true;
    window_drawn_ = true;
    bg_fifo_size_ = 0;
    bg_fifo_head_ = 0;
    fetch_step_ = FetchStep::TileNumber;
    fetch_dots_ = 0;
    fetcher_x_ = 0;
    discard_next_push_ = false;
    discard_ = latched_wx_ < 7 ? static_cast<uint8_t>(7 - latched_wx_) : 0;
}

//////////////////////////////////////////////////////////////////////////////
// Sprites
//////////////////////////////////////////////////////////////////////////////

int Ppu::next_sprite_index() const {
    if ((lcdc_ & kLcdcObjEnable) == 0) {
        return -1;
    }
    for (uint32_t i = 0; i < sprite_count_; ++i) {
        const Sprite& s = sprites_[i];
        if (!s.fetched && s.x != 0 && s.x <= lx_ + 8) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// Earlier-fetched sprites keep their opaque pixels: fetch order is
// X order, then OAM order, which is the DMG priority rule.
void Ppu::merge_sprite(const Sprite& sprite, std::span<const uint8_t> vram) {
    const uint8_t height = sprite_height();
    uint8_t row = static_cast<uint8_t>(ly_ + 16 - sprite.y);
    if (sprite.attributes & kAttrYFlip) {
        row = static_cast<uint8_t>(height - 1 - row);
    }
    uint8_t tile = sprite.tile;
    if (height == 16) {
        tile &= 0xFE;
    }
    const uint16_t address = static_cast<uint16_t>(tile * 16 + row * 2);
    const uint8_t low = vram[address];
    const uint8_t high = vram[address + 1];

    for (int i = 0; i < 8; ++i) {
        const int screen_x = static_cast<int>(sprite.x) - 8 + i;
        if (screen_x < lx_ || screen_x >= static_cast<int>(video_constants::FRAME_WIDTH)) {
            continue;
        }
        const int bit = (sprite.attributes & kAttrXFlip) ? i : 7 - i;
        const uint8_t color = static_cast<uint8_t>((((high >> bit) & 1) << 1) |
                                                   ((low >> bit) & 1));
        SpritePixel& slot = sprite_fifo_[screen_x & 0x07];
        if (slot.color == 0 && color != 0) {
            slot.color = color;
            slot.palette = (sprite.attributes & kAttrPalette) ? 1 : 0;
            slot.behind_bg = (sprite.attributes & kAttrBehindBg) != 0;
        }
    }
}

} // namespace gbium

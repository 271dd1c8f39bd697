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

#include "AudioRegisters.hpp"
#include "Cartridge.hpp"
#include "FrameBuffer.hpp"
#include "InterruptController.hpp"
#include "Joypad.hpp"
#include "MemoryMap.hpp"
#include "OamDma.hpp"
#include "Ppu.hpp"
#include "Serial.hpp"
#include "Timer.hpp"
#include "Types.hpp"
#include "devices/Ram.hpp"
#include "devices/Rom.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace gbium {

// DMG hardware configuration using the MemoryMap infrastructure.
//
// This class holds all hardware devices and provides:
// - Memory-mapped access via the memory_map
// - CPU-side access with OAM DMA bus contention
// - Direct access to devices for clocking and configuration
//
// Memory Map:
//   0x0000-0x00FF: Boot ROM while mapped (until 0xFF50 is written)
//   0x0000-0x7FFF: Cartridge ROM / bank controller registers
//   0x8000-0x9FFF: VRAM (blocked during pixel transfer)
//   0xA000-0xBFFF: Cartridge RAM
//   0xC000-0xDFFF: Work RAM
//   0xE000-0xFDFF: Echo of work RAM
//   0xFE00-0xFE9F: OAM (blocked during OAM scan, pixel transfer and DMA)
//   0xFEA0-0xFEFF: Unusable (reads 0xFF)
//   0xFF00-0xFF7F: I/O
//     0xFF00:      Joypad
//     0xFF01-02:   Serial
//     0xFF04-07:   Timer
//     0xFF0F:      IF
//     0xFF10-3F:   Sound registers and wave RAM
//     0xFF40-4B:   PPU (0xFF46 OAM DMA)
//     0xFF50:      Boot ROM disable
//   0xFF80-0xFFFE: High RAM
//   0xFFFF:        IE
//
class DmgHardware {
public:
    static constexpr std::string_view MACHINE_TYPE = "dmg";
    static constexpr std::string_view MACHINE_DISPLAY_NAME = "Game Boy (DMG)";

    // Memory
    Rom<kBootRomSize> boot_rom;
    Cartridge cartridge;
    Ram<kVramSize> vram;
    Ram<kWorkRamSize> wram;
    Ram<kOamSize> oam;
    Ram<kHighRamSize> hram;

    // Devices
    InterruptController irq;
    Timer timer;
    Joypad joypad;
    Serial serial;
    AudioRegisters audio;
    Ppu ppu;
    OamDma dma;

    // Completed frames, published at each VBlank
    FrameBuffer frame_buffer;

    bool boot_rom_mapped = false;

    // Cartridge ROM with the boot ROM overlaid on its first 256 bytes
    struct CartRomPort {
        DmgHardware& hw;

        uint8_t read(uint16_t offset) const {
            if (hw.boot_rom_mapped && offset < kBootRomSize) {
                return hw.boot_rom.read(offset);
            }
            return hw.cartridge.read_rom(offset);
        }

        void write(uint16_t offset, uint8_t value) {
            hw.cartridge.write_control(offset, value);
        }
    };

    // VRAM as seen from the CPU bus
    struct VramPort {
        DmgHardware& hw;

        uint8_t read(uint16_t offset) const {
            return hw.ppu.vram_accessible() ? hw.vram.read(offset) : 0xFF;
        }

        void write(uint16_t offset, uint8_t value) {
            if (hw.ppu.vram_accessible()) {
                hw.vram.write(offset, value);
            }
        }

        uint8_t peek(uint16_t offset) const { return hw.vram.read(offset); }
    };

    // OAM as seen from the CPU bus
    struct OamPort {
        DmgHardware& hw;

        bool accessible() const {
            return hw.ppu.oam_accessible() && !hw.dma.active();
        }

        uint8_t read(uint16_t offset) const {
            return accessible() ? hw.oam.read(offset) : 0xFF;
        }

        void write(uint16_t offset, uint8_t value) {
            if (accessible()) {
                hw.oam.write(offset, value);
            }
        }

        uint8_t peek(uint16_t offset) const { return hw.oam.read(offset); }
    };

    struct InterruptFlagPort {
        InterruptController& irq;

        uint8_t read(uint16_t) const { return irq.request_mask(); }
        void write(uint16_t, uint8_t value) { irq.set_request_mask(value); }
    };

    struct InterruptEnablePort {
        InterruptController& irq;

        uint8_t read(uint16_t) const { return irq.enable_mask(); }
        void write(uint16_t, uint8_t value) { irq.set_enable_mask(value); }
    };

    // 0xFF50: any non-zero write unmaps the boot ROM until reset
    struct BootRegister {
        DmgHardware& hw;

        uint8_t read(uint16_t) const { return 0xFF; }
        void write(uint16_t, uint8_t value) {
            if (value != 0) {
                hw.boot_rom_mapped = false;
            }
        }
    };

    CartRomPort cart_rom{*this};
    Cartridge::RamPort cart_ram{cartridge};
    VramPort vram_port{*this};
    OamPort oam_port{*this};
    InterruptFlagPort if_port{irq};
    InterruptEnablePort ie_port{irq};
    BootRegister boot_register{*this};

    // Memory map type (deduced from make_memory_map)
    using MemoryMapType = decltype(
        MemoryMap{
            make_region<0x0000, 0x7FFF>(std::declval<CartRomPort&>()),
            make_region<0x8000, 0x9FFF>(std::declval<VramPort&>()),
            make_region<0xA000, 0xBFFF>(std::declval<Cartridge::RamPort&>()),
            make_region<0xC000, 0xDFFF>(std::declval<Ram<kWorkRamSize>&>()),
            make_region<0xE000, 0xFDFF, Mirror<0x1FFF>>(std::declval<Ram<kWorkRamSize>&>()),
            make_region<0xFE00, 0xFE9F>(std::declval<OamPort&>()),
            make_region<0xFF00, 0xFF00>(std::declval<Joypad&>()),
            make_region<0xFF01, 0xFF02>(std::declval<Serial&>()),
            make_region<0xFF04, 0xFF07>(std::declval<Timer&>()),
            make_region<0xFF0F, 0xFF0F>(std::declval<InterruptFlagPort&>()),
            make_region<0xFF10, 0xFF3F>(std::declval<AudioRegisters&>()),
            make_region<0xFF46, 0xFF46>(std::declval<OamDma&>()),
            make_region<0xFF40, 0xFF4B>(std::declval<Ppu&>()),
            make_region<0xFF50, 0xFF50>(std::declval<BootRegister&>()),
            make_region<0xFF80, 0xFFFE>(std::declval<Ram<kHighRamSize>&>()),
            make_region<0xFFFF, 0xFFFF>(std::declval<InterruptEnablePort&>())
        }
    );

    DmgHardware()
        : memory_map_(make_memory_map())
    {
        reset();
    }

    // Non-copyable, non-movable (ports and the memory map refer back here)
    DmgHardware(const DmgHardware&) = delete;
    DmgHardware& operator=(const DmgHardware&) = delete;

    // MemoryMappedDevice interface (delegates to memory_map)
    uint8_t read(uint16_t addr) const {
        return memory_map_.read(addr);
    }

    void write(uint16_t addr, uint8_t value) {
        memory_map_.write(addr, value);
    }

    // Stored values, ignoring PPU and DMA access blocking
    uint8_t peek(uint16_t addr) const {
        return memory_map_.peek(addr);
    }

    // CPU bus: while OAM DMA runs only 0xFF00-0xFFFF responds
    uint8_t cpu_read(uint16_t addr) const {
        if (dma.active() && addr < kIoStart) {
            return 0xFF;
        }
        return memory_map_.read(addr);
    }

    void cpu_write(uint16_t addr, uint8_t value) {
        if (dma.active() && addr < kIoStart) {
            return;
        }
        memory_map_.write(addr, value);
    }

    // DmaBus interface
    uint8_t dma_read(uint16_t addr) const {
        return memory_map_.peek(addr);
    }

    void oam_write(uint16_t offset, uint8_t value) {
        oam.write(offset, value);
    }

    // STOP resets the divider
    void enter_stop() {
        timer.write(Timer::REG_DIV, 0);
    }

    // Arguments for the PPU's per-dot tick
    PpuContext ppu_context() {
        return PpuContext{vram.bytes(), oam.bytes(), irq, frame_buffer};
    }

    // Power-on state. The cartridge image, its RAM and the boot ROM survive.
    void reset() {
        boot_rom_mapped = boot_rom.loaded();
        cartridge.reset();
        vram.clear();
        wram.clear();
        oam.clear();
        hram.clear();
        irq.reset();
        timer.reset();
        joypad.reset();
        serial.reset();
        audio.reset();
        ppu.reset();
        dma.reset();
        frame_buffer.clear();
    }

    // I/O register values the boot ROM leaves behind
    void apply_post_boot_state() {
        boot_rom_mapped = false;
        joypad.write(0, 0x00);
        timer.set_counter(0xABCC);
        irq.set_request_mask(0x01);

        // Sound must be powered before its other registers accept writes
        audio.write(AudioRegisters::REG_NR52, 0xF1);
        for (const auto& [offset, value] : kPostBootAudio) {
            audio.write(offset, value);
        }

        ppu.write(Ppu::REG_BGP, 0xFC);
        ppu.write(Ppu::REG_LCDC, 0x91);
    }

    // Throws std::invalid_argument unless the image is exactly 256 bytes
    void load_boot_rom(std::span<const uint8_t> data) {
        if (data.size() != kBootRomSize) {
            throw std::invalid_argument("boot ROM must be 256 bytes");
        }
        boot_rom.load(data);
    }

    void insert_cartridge(Cartridge cart) {
        cartridge = std::move(cart);
    }

private:
    static constexpr std::array<std::pair<uint8_t, uint8_t>, 16> kPostBootAudio = {{
        {0x00, 0x80}, {0x01, 0xBF}, {0x02, 0xF3}, {0x04, 0xBF},
        {0x06, 0x3F}, {0x07, 0x00}, {0x09, 0xBF}, {0x0A, 0x7F},
        {0x0B, 0xFF}, {0x0C, 0x9F}, {0x0E, 0xBF}, {0x10, 0xFF},
        {0x13, 0xBF}, {0x14, 0x77}, {0x15, 0xF3}, {0x11, 0x00},
    }};

    MemoryMapType memory_map_;

    MemoryMapType make_memory_map() {
        // Order matters: first match wins.
        // DMA register before the PPU block that contains it.
        return MemoryMap{
            make_region<0x0000, 0x7FFF>(cart_rom),
            make_region<0x8000, 0x9FFF>(vram_port),
            make_region<0xA000, 0xBFFF>(cart_ram),
            make_region<0xC000, 0xDFFF>(wram),
            make_region<0xE000, 0xFDFF, Mirror<0x1FFF>>(wram),
            make_region<0xFE00, 0xFE9F>(oam_port),
            make_region<0xFF00, 0xFF00>(joypad),
            make_region<0xFF01, 0xFF02>(serial),
            make_region<0xFF04, 0xFF07>(timer),
            make_region<0xFF0F, 0xFF0F>(if_port),
            make_region<0xFF10, 0xFF3F>(audio),
            make_region<0xFF46, 0xFF46>(dma),
            make_region<0xFF40, 0xFF4B>(ppu),
            make_region<0xFF50, 0xFF50>(boot_register),
            make_region<0xFF80, 0xFFFE>(hram),
            make_region<0xFFFF, 0xFFFF>(ie_port)
        };
    }
};

} // namespace gbium

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

#ifndef GBIUM_CARTRIDGE_HPP
#define GBIUM_CARTRIDGE_HPP

#include "Types.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace gbium {

// Rejected cartridge image (truncated, or a controller this core lacks)
class CartridgeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Summary of the 0x0100-0x014F header block
struct CartridgeHeader {
    std::string title;
    uint8_t cartridge_type = 0x00;
    uint8_t rom_size_code = 0x00;
    uint8_t ram_size_code = 0x00;
    size_t declared_rom_size = 0;     // 0 when the size code is unknown
    size_t declared_ram_size = 0;
    bool has_battery = false;
    bool header_checksum_ok = false;
    bool global_checksum_ok = false;
    bool rom_size_mismatch = false;   // Image length differs from declared size
};

// Physical sizes the controllers reduce bank numbers against
struct BankLayout {
    size_t rom_banks = 2;
    size_t ram_size = 0;

    size_t ram_banks() const {
        return ram_size == 0 ? 0 : (ram_size + kRamBankSize - 1) / kRamBankSize;
    }
};

// Bank controllers. Each maps a CPU address to a physical offset into the
// ROM or RAM image and latches control writes to 0x0000-0x7FFF.

template<typename T>
concept BankController = requires(const T& c, T& m, uint16_t addr, uint8_t value,
                                  const BankLayout& layout) {
    { c.rom_address(addr, layout) } -> std::convertible_to<uint32_t>;
    { c.ram_address(addr, layout) } -> std::convertible_to<std::optional<uint32_t>>;
    { m.write(addr, value) } -> std::same_as<void>;
};

// ROM only, with an optional unbanked 8KB RAM
struct NoMbc {
    uint32_t rom_address(uint16_t addr, const BankLayout& layout) const;
    std::optional<uint32_t> ram_address(uint16_t addr, const BankLayout& layout) const;
    void write(uint16_t /*addr*/, uint8_t /*value*/) {}
};

// MBC1, including the MBC1M multicart wiring where BANK2 sits at bit 4
struct Mbc1 {
    bool ram_enabled = false;
    uint8_t bank1 = 0x01;    // 5 bits, never zero
    uint8_t bank2 = 0x00;    // 2 bits
    bool advanced_mode = false;
    bool multicart = false;

    uint32_t rom_address(uint16_t addr, const BankLayout& layout) const;
    std::optional<uint32_t> ram_address(uint16_t addr, const BankLayout& layout) const;
    void write(uint16_t addr, uint8_t value);
};

// MBC2 with its built-in 512 x 4-bit RAM
struct Mbc2 {
    static constexpr size_t kRamSize = 512;

    bool ram_enabled = false;
    uint8_t rom_bank = 0x01;

    uint32_t rom_address(uint16_t addr, const BankLayout& layout) const;
    std::optional<uint32_t> ram_address(uint16_t addr, const BankLayout& layout) const;
    void write(uint16_t addr, uint8_t value);
};

// MBC3 without the real-time clock; RTC register selects read 0xFF
struct Mbc3 {
    bool ram_enabled = false;
    uint8_t rom_bank = 0x01;
    uint8_t ram_select = 0x00;

    uint32_t rom_address(uint16_t addr, const BankLayout& layout) const;
    std::optional<uint32_t> ram_address(uint16_t addr, const BankLayout& layout) const;
    void write(uint16_t addr, uint8_t value);
};

// MBC5: 9-bit ROM bank (bank 0 selectable), 4-bit RAM bank
struct Mbc5 {
    bool ram_enabled = false;
    uint16_t rom_bank = 0x001;
    uint8_t ram_bank = 0x00;

    uint32_t rom_address(uint16_t addr, const BankLayout& layout) const;
    std::optional<uint32_t> ram_address(uint16_t addr, const BankLayout& layout) const;
    void write(uint16_t addr, uint8_t value);
};

static_assert(BankController<NoMbc>);
static_assert(BankController<Mbc1>);
static_assert(BankController<Mbc2>);
static_assert(BankController<Mbc3>);
static_assert(BankController<Mbc5>);

using BankControllerState = std::variant<NoMbc, Mbc1, Mbc2, Mbc3, Mbc5>;

const char* controller_name(const BankControllerState& controller);

// Game Pak: ROM image, external RAM and the bank controller state.
//
// A default-constructed Cartridge is an empty slot: ROM and RAM read 0xFF.
class Cartridge {
public:
    Cartridge() = default;

    // Parse the header and select a controller.
    // Throws CartridgeError for truncated images and unsupported controllers.
    static Cartridge from_rom(std::vector<uint8_t> rom);

    bool inserted() const { return !rom_.empty(); }

    // 0x0000-0x7FFF
    uint8_t read_rom(uint16_t addr) const;
    void write_control(uint16_t addr, uint8_t value);

    // 0xA000-0xBFFF, addr relative to 0xA000
    uint8_t read_ram(uint16_t addr) const;
    void write_ram(uint16_t addr, uint8_t value);

    // Bank currently mapped at 0x4000-0x7FFF
    uint32_t rom_bank() const;

    // RAM bank mapped at 0xA000-0xBFFF; nullopt while RAM is disabled or absent
    std::optional<uint32_t> ram_bank() const;

    // Return the controller to its power-on register state
    void reset();

    const CartridgeHeader& header() const { return header_; }
    const BankControllerState& controller() const { return controller_; }
    const BankLayout& layout() const { return layout_; }
    std::span<const uint8_t> rom() const { return rom_; }

    // External RAM snapshot for battery saves
    std::vector<uint8_t> save_ram() const { return ram_; }

    // Seed external RAM; extra bytes are ignored, missing bytes keep their value
    void load_ram(std::span<const uint8_t> data);

    // Memory-mapped adapters
    struct RomPort {
        Cartridge& cartridge;
        uint8_t read(uint16_t offset) const { return cartridge.read_rom(offset); }
        void write(uint16_t offset, uint8_t value) { cartridge.write_control(offset, value); }
    };

    struct RamPort {
        Cartridge& cartridge;
        uint8_t read(uint16_t offset) const { return cartridge.read_ram(offset); }
        void write(uint16_t offset, uint8_t value) { cartridge.write_ram(offset, value); }
    };

private:
    std::vector<uint8_t> rom_;
    std::vector<uint8_t> ram_;
    CartridgeHeader header_;
    BankLayout layout_;
    BankControllerState controller_;
};

// Header parsing, exposed for tooling and tests
CartridgeHeader parse_header(std::span<const uint8_t> rom);

} // namespace gbium

#endif // GBIUM_CARTRIDGE_HPP

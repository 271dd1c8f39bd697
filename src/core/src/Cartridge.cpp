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

#include <gbium/Cartridge.hpp>

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <sstream>
#include <iomanip>

namespace gbium {

namespace {

constexpr size_t kHeaderEnd = 0x0150;
constexpr size_t kTitleStart = 0x0134;
constexpr size_t kTitleLength = 16;
constexpr size_t kLogoStart = 0x0104;
constexpr size_t kLogoLength = 48;
constexpr size_t kTypeAddr = 0x0147;
constexpr size_t kRomSizeAddr = 0x0148;
constexpr size_t kRamSizeAddr = 0x0149;
constexpr size_t kHeaderChecksumAddr = 0x014D;
constexpr size_t kGlobalChecksumAddr = 0x014E;
constexpr size_t kMulticartSize = 0x100000;

enum class Controller : uint8_t { None, Mbc1, Mbc2, Mbc3, Mbc5 };

struct TypeInfo {
    Controller controller;
    bool has_ram;
    bool has_battery;
};

std::optional<TypeInfo> lookup_type(uint8_t type) {
    switch (type) {
    case 0x00: return TypeInfo{Controller::None, false, false};
    case 0x01: return TypeInfo{Controller::Mbc1, false, false};
    case 0x02: return TypeInfo{Controller::Mbc1, true, false};
    case 0x03: return TypeInfo{Controller::Mbc1, true, true};
    case 0x05: return TypeInfo{Controller::Mbc2, false, false};
    case 0x06: return TypeInfo{Controller::Mbc2, false, true};
    case 0x08: return TypeInfo{Controller::None, true, false};
    case 0x09: return TypeInfo{Controller::None, true, true};
    case 0x0F: return TypeInfo{Controller::Mbc3, false, true};
    case 0x10: return TypeInfo{Controller::Mbc3, true, true};
    case 0x11: return TypeInfo{Controller::Mbc3, false, false};
    case 0x12: return TypeInfo{Controller::Mbc3, true, false};
    case 0x13: return TypeInfo{Controller::Mbc3, true, true};
    case 0x19: return TypeInfo{Controller::Mbc5, false, false};
    case 0x1A: return TypeInfo{Controller::Mbc5, true, false};
    case 0x1B: return TypeInfo{Controller::Mbc5, true, true};
    case 0x1C: return TypeInfo{Controller::Mbc5, false, false};
    case 0x1D: return TypeInfo{Controller::Mbc5, true, false};
    case 0x1E: return TypeInfo{Controller::Mbc5, true, true};
    default:   return std::nullopt;
    }
}

// Real controllers this core does not emulate
const char* unsupported_type_name(uint8_t type) {
    switch (type) {
    case 0x0B:
    case 0x0C:
    case 0x0D: return "MMM01";
    case 0x20: return "MBC6";
    case 0x22: return "MBC7";
    case 0xFC: return "Pocket Camera";
    case 0xFD: return "TAMA5";
    case 0xFE: return "HuC3";
    case 0xFF: return "HuC1";
    default:   return nullptr;
    }
}

size_t rom_size_from_code(uint8_t code) {
    if (code <= 0x08) {
        return size_t{0x8000} << code;
    }
    return 0;
}

size_t ram_size_from_code(uint8_t code) {
    switch (code) {
    case 0x01: return 0x0800;
    case 0x02: return 0x2000;
    case 0x03: return 0x8000;
    case 0x04: return 0x20000;
    case 0x05: return 0x10000;
    default:   return 0;
    }
}

std::string hex_byte(uint8_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(value);
    return oss.str();
}

// MBC1M carts repeat the boot logo at the start of each 256KB game
bool detect_multicart(std::span<const uint8_t> rom) {
    if (rom.size() != kMulticartSize) {
        return false;
    }
    const size_t second = 0x10 * kRomBankSize + kLogoStart;
    return rom[kLogoStart] == 0xCE &&
           std::equal(rom.begin() + kLogoStart, rom.begin() + kLogoStart + kLogoLength,
                      rom.begin() + second);
}

uint32_t bank_offset(size_t bank, size_t bank_count, uint16_t addr) {
    bank %= bank_count == 0 ? 1 : bank_count;
    return static_cast<uint32_t>(bank * kRomBankSize + (addr & 0x3FFF));
}

std::optional<uint32_t> ram_offset(size_t bank, const BankLayout& layout, uint16_t addr) {
    if (layout.ram_size == 0) {
        return std::nullopt;
    }
    bank %= layout.ram_banks();
    return static_cast<uint32_t>((bank * kRamBankSize + (addr & 0x1FFF)) % layout.ram_size);
}

bool ram_enable_value(uint8_t value) {
    return (value & 0x0F) == 0x0A;
}

} // anonymous namespace

//////////////////////////////////////////////////////////////////////////////
// Bank controllers
//////////////////////////////////////////////////////////////////////////////

uint32_t NoMbc::rom_address(uint16_t addr, const BankLayout& /*layout*/) const {
    return addr & 0x7FFF;
}

std::optional<uint32_t> NoMbc::ram_address(uint16_t addr, const BankLayout& layout) const {
    return ram_offset(0, layout, addr);
}

uint32_t Mbc1::rom_address(uint16_t addr, const BankLayout& layout) const {
    const unsigned shift = multicart ? 4 : 5;
    size_t bank;
    if (addr < 0x4000) {
        bank = advanced_mode ? (size_t{bank2} << shift) : 0;
    } else {
        const uint8_t low = multicart ? (bank1 & 0x0F) : bank1;
        bank = (size_t{bank2} << shift) | low;
    }
    return bank_offset(bank, layout.rom_banks, addr);
}

std::optional<uint32_t> Mbc1::ram_address(uint16_t addr, const BankLayout& layout) const {
    if (!ram_enabled) {
        return std::nullopt;
    }
    return ram_offset(advanced_mode ? bank2 : 0, layout, addr);
}

void Mbc1::write(uint16_t addr, uint8_t value) {
    switch (addr >> 13) {
    case 0:
        ram_enabled = ram_enable_value(value);
        break;
    case 1:
        bank1 = value & 0x1F;
        if (bank1 == 0) {
            bank1 = 1;
        }
        break;
    case 2:
        bank2 = value & 0x03;
        break;
    case 3:
        advanced_mode = (value & 0x01) != 0;
        break;
    }
}

uint32_t Mbc2::rom_address(uint16_t addr, const BankLayout& layout) const {
    return bank_offset(addr < 0x4000 ? 0 : rom_bank, layout.rom_banks, addr);
}

std::optional<uint32_t> Mbc2::ram_address(uint16_t addr, const BankLayout& /*layout*/) const {
    if (!ram_enabled) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(addr & 0x01FF);
}

void Mbc2::write(uint16_t addr, uint8_t value) {
    if (addr >= 0x4000) {
        return;
    }
    // Address bit 8 selects between RAM enable and ROM bank
    if (addr & 0x0100) {
        rom_bank = value & 0x0F;
        if (rom_bank == 0) {
            rom_bank = 1;
        }
    } else {
        ram_enabled = ram_enable_value(value);
    }
}

uint32_t Mbc3::rom_address(uint16_t addr, const BankLayout& layout) const {
    return bank_offset(addr < 0x4000 ? 0 : rom_bank, layout.rom_banks, addr);
}

std::optional<uint32_t> Mbc3::ram_address(uint16_t addr, const BankLayout& layout) const {
    if (!ram_enabled || ram_select > 0x03) {
        return std::nullopt;
    }
    return ram_offset(ram_select, layout, addr);
}

void Mbc3::write(uint16_t addr, uint8_t value) {
    switch (addr >> 13) {
    case 0:
        ram_enabled = ram_enable_value(value);
        break;
    case 1:
        rom_bank = value & 0x7F;
        if (rom_bank == 0) {
            rom_bank = 1;
        }
        break;
    case 2:
        ram_select = value;
        break;
    case 3:
        // RTC latch: no clock to latch
        break;
    }
}

uint32_t Mbc5::rom_address(uint16_t addr, const BankLayout& layout) const {
    return bank_offset(addr < 0x4000 ? 0 : rom_bank, layout.rom_banks, addr);
}

std::optional<uint32_t> Mbc5::ram_address(uint16_t addr, const BankLayout& layout) const {
    if (!ram_enabled) {
        return std::nullopt;
    }
    return ram_offset(ram_bank, layout, addr);
}

void Mbc5::write(uint16_t addr, uint8_t value) {
    if (addr < 0x2000) {
        ram_enabled = ram_enable_value(value);
    } else if (addr < 0x3000) {
        rom_bank = static_cast<uint16_t>((rom_bank & 0x100) | value);
    } else if (addr < 0x4000) {
        rom_bank = static_cast<uint16_t>((rom_bank & 0x0FF) | ((value & 0x01) << 8));
    } else if (addr < 0x6000) {
        ram_bank = value & 0x0F;
    }
}

const char* controller_name(const BankControllerState& controller) {
    switch (controller.index()) {
    case 0: return "ROM";
    case 1: return std::get<Mbc1>(controller).multicart ? "MBC1M" : "MBC1";
    case 2: return "MBC2";
    case 3: return "MBC3";
    case 4: return "MBC5";
    }
    return "unknown";
}

//////////////////////////////////////////////////////////////////////////////
// Header
//////////////////////////////////////////////////////////////////////////////

CartridgeHeader parse_header(std::span<const uint8_t> rom) {
    if (rom.size() < kHeaderEnd) {
        throw CartridgeError("ROM image is " + std::to_string(rom.size()) +
                             " bytes, too short to contain a cartridge header");
    }

    CartridgeHeader header;

    for (size_t i = 0; i < kTitleLength; ++i) {
        const uint8_t c = rom[kTitleStart + i];
        if (c == 0) {
            break;
        }
        if (std::isprint(c)) {
            header.title.push_back(static_cast<char>(c));
        }
    }
    while (!header.title.empty() && header.title.back() == ' ') {
        header.title.pop_back();
    }

    header.cartridge_type = rom[kTypeAddr];
    header.rom_size_code = rom[kRomSizeAddr];
    header.ram_size_code = rom[kRamSizeAddr];
    header.declared_rom_size = rom_size_from_code(header.rom_size_code);
    header.declared_ram_size = ram_size_from_code(header.ram_size_code);

    if (auto info = lookup_type(header.cartridge_type)) {
        header.has_battery = info->has_battery;
    }

    uint8_t x = 0;
    for (size_t i = kTitleStart; i < kHeaderChecksumAddr; ++i) {
        x = static_cast<uint8_t>(x - rom[i] - 1);
    }
    header.header_checksum_ok = x == rom[kHeaderChecksumAddr];

    uint16_t sum = 0;
    for (size_t i = 0; i < rom.size(); ++i) {
        if (i != kGlobalChecksumAddr && i != kGlobalChecksumAddr + 1) {
            sum = static_cast<uint16_t>(sum + rom[i]);
        }
    }
    const uint16_t expected = static_cast<uint16_t>(
        (rom[kGlobalChecksumAddr] << 8) | rom[kGlobalChecksumAddr + 1]);
    header.global_checksum_ok = sum == expected;

    header.rom_size_mismatch =
        header.declared_rom_size != 0 && header.declared_rom_size != rom.size();

    return header;
}

//////////////////////////////////////////////////////////////////////////////
// Cartridge
//////////////////////////////////////////////////////////////////////////////

Cartridge Cartridge::from_rom(std::vector<uint8_t> rom) {
    CartridgeHeader header = parse_header(rom);

    if (const char* name = unsupported_type_name(header.cartridge_type)) {
        throw CartridgeError(std::string("Unsupported cartridge type ") +
                             hex_byte(header.cartridge_type) + " (" + name + ")");
    }

    // Unassigned type codes fall back to a plain ROM with no RAM
    const TypeInfo info = lookup_type(header.cartridge_type)
                              .value_or(TypeInfo{Controller::None, false, false});

    Cartridge cart;
    cart.layout_.rom_banks = std::max<size_t>(1, (rom.size() + kRomBankSize - 1) / kRomBankSize);

    switch (info.controller) {
    case Controller::None:
        cart.controller_ = NoMbc{};
        break;
    case Controller::Mbc1: {
        Mbc1 mbc;
        mbc.multicart = detect_multicart(rom);
        cart.controller_ = mbc;
        break;
    }
    case Controller::Mbc2:
        cart.controller_ = Mbc2{};
        break;
    case Controller::Mbc3:
        cart.controller_ = Mbc3{};
        break;
    case Controller::Mbc5:
        cart.controller_ = Mbc5{};
        break;
    }

    if (info.controller == Controller::Mbc2) {
        cart.layout_.ram_size = Mbc2::kRamSize;
    } else if (info.has_ram) {
        cart.layout_.ram_size = header.declared_ram_size;
    }
    if (info.controller == Controller::None && cart.layout_.ram_size > kRamBankSize) {
        cart.layout_.ram_size = kRamBankSize;
    }

    cart.ram_.assign(cart.layout_.ram_size, 0x00);
    cart.header_ = std::move(header);
    cart.rom_ = std::move(rom);
    return cart;
}

uint8_t Cartridge::read_rom(uint16_t addr) const {
    if (rom_.empty()) {
        return 0xFF;
    }
    const uint32_t offset = std::visit(
        [&](const auto& mbc) { return mbc.rom_address(addr, layout_); }, controller_);
    return offset < rom_.size() ? rom_[offset] : 0xFF;
}

void Cartridge::write_control(uint16_t addr, uint8_t value) {
    if (rom_.empty()) {
        return;
    }
    std::visit([&](auto& mbc) { mbc.write(addr, value); }, controller_);
}

uint8_t Cartridge::read_ram(uint16_t addr) const {
    const auto offset = std::visit(
        [&](const auto& mbc) { return mbc.ram_address(addr, layout_); }, controller_);
    if (!offset || *offset >= ram_.size()) {
        return 0xFF;
    }
    if (std::holds_alternative<Mbc2>(controller_)) {
        return static_cast<uint8_t>(ram_[*offset] | 0xF0);
    }
    return ram_[*offset];
}

void Cartridge::write_ram(uint16_t addr, uint8_t value) {
    const auto offset = std::visit(
        [&](const auto& mbc) { return mbc.ram_address(addr, layout_); }, controller_);
    if (!offset || *offset >= ram_.size()) {
        return;
    }
    if (std::holds_alternative<Mbc2>(controller_)) {
        value &= 0x0F;
    }
    ram_[*offset] = value;
}

uint32_t Cartridge::rom_bank() const {
    const uint32_t offset = std::visit(
        [&](const auto& mbc) { return mbc.rom_address(0x4000, layout_); }, controller_);
    return static_cast<uint32_t>(offset / kRomBankSize);
}

std::optional<uint32_t> Cartridge::ram_bank() const {
    if (ram_.empty()) {
        return std::nullopt;
    }
    const auto offset = std::visit(
        [&](const auto& mbc) { return mbc.ram_address(0x0000, layout_); }, controller_);
    if (!offset) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*offset / kRamBankSize);
}

void Cartridge::reset() {
    std::visit([](auto& mbc) {
        using T = std::decay_t<decltype(mbc)>;
        if constexpr (std::is_same_v<T, Mbc1>) {
            const bool multicart = mbc.multicart;
            mbc = Mbc1{};
            mbc.multicart = multicart;
        } else {
            mbc = T{};
        }
    }, controller_);
}

void Cartridge::load_ram(std::span<const uint8_t> data) {
    const size_t count = std::min(data.size(), ram_.size());
    std::copy_n(data.begin(), count, ram_.begin());
}

} // namespace gbium

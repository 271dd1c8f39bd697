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
#include <catch2/generators/catch_generators.hpp>
#include <gbium/Machines.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace gbium;

// Serial-reporting test ROMs. Each prints its name, then "Passed" or
// "Failed" over the link port. Configure with -DGBIUM_TEST_ROM_DIR=<dir>.

namespace {

// Generous: the longest of these finishes in under a minute of emulated time
constexpr uint64_t kMaxFrames = 60 * 60;

std::vector<uint8_t> read_rom(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

std::string run_until_verdict(Dmg& machine) {
    const std::string& output = machine.hardware().serial.output();
    for (uint64_t frame = 0; frame < kMaxFrames; ++frame) {
        machine.step_frame();
        if (output.find("Passed") != std::string::npos ||
            output.find("Failed") != std::string::npos) {
            break;
        }
        if (machine.locked()) {
            break;
        }
    }
    return output;
}

} // anonymous namespace

TEST_CASE("Serial-reporting conformance ROMs", "[conformance]") {
#ifndef GBIUM_TEST_ROM_DIR
    SKIP("GBIUM_TEST_ROM_DIR not configured");
#else
    auto name = GENERATE(as<std::string>{},
        "cpu_instrs/individual/01-special.gb",
        "cpu_instrs/individual/02-interrupts.gb",
        "cpu_instrs/individual/03-op sp,hl.gb",
        "cpu_instrs/individual/04-op r,imm.gb",
        "cpu_instrs/individual/05-op rp.gb",
        "cpu_instrs/individual/06-ld r,r.gb",
        "cpu_instrs/individual/07-jr,jp,call,ret,rst.gb",
        "cpu_instrs/individual/08-misc instrs.gb",
        "cpu_instrs/individual/09-op r,r.gb",
        "cpu_instrs/individual/10-bit ops.gb",
        "cpu_instrs/individual/11-op a,(hl).gb",
        "instr_timing/instr_timing.gb",
        "mem_timing/individual/01-read_timing.gb",
        "mem_timing/individual/02-write_timing.gb",
        "mem_timing/individual/03-modify_timing.gb");

    const std::filesystem::path rom_dir(GBIUM_TEST_ROM_DIR);
    if (!std::filesystem::is_directory(rom_dir)) {
        SKIP("no test ROM directory at " << rom_dir.string());
    }

    const std::filesystem::path path = rom_dir / name;
    INFO(path.string());
    REQUIRE(std::filesystem::exists(path));

    INFO(name);
    Dmg machine;
    machine.load_cartridge(read_rom(path));

    const std::string output = run_until_verdict(machine);
    INFO(output);
    CHECK_FALSE(machine.locked());
    CHECK(output.find("Passed") != std::string::npos);
#endif
}

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

#ifndef GBIUM_SERVER_SERVER_MAIN_HPP
#define GBIUM_SERVER_SERVER_MAIN_HPP

#include "gbium/Cartridge.hpp"
#include "gbium/ClockTypes.hpp"
#include "gbium/Machines.hpp"
#include "gbium/service/Server.hpp"
#include "gbium/server/RomPaths.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace gbium::server {

namespace {

constexpr uint16_t DEFAULT_GRPC_PORT = 50051;

std::atomic<bool> g_running{true};

void signal_handler(int /*signal*/) {
    g_running = false;
}

std::vector<uint8_t> load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("Cannot read file: " + filepath.string());
    }

    return data;
}

void save_file(const std::filesystem::path& filepath, const std::vector<uint8_t>& data) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot create file: " + filepath.string());
    }
    if (!file.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()))) {
        throw std::runtime_error("Cannot write file: " + filepath.string());
    }
}

void report_header(const Cartridge& cartridge) {
    const CartridgeHeader& header = cartridge.header();
    std::cout << "Title: " << header.title << "\n"
              << "Controller: " << controller_name(cartridge.controller())
              << " (type $" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
              << static_cast<int>(header.cartridge_type) << std::dec << std::setfill(' ') << ")\n"
              << "ROM: " << cartridge.rom().size() << " bytes, RAM: "
              << cartridge.layout().ram_size << " bytes"
              << (header.has_battery ? " (battery)" : "") << "\n";

    if (!header.header_checksum_ok) {
        std::cerr << "Warning: header checksum mismatch\n";
    }
    if (!header.global_checksum_ok) {
        std::cerr << "Warning: global checksum mismatch\n";
    }
    if (header.rom_size_mismatch) {
        std::cerr << "Warning: ROM is " << cartridge.rom().size()
                  << " bytes, header declares " << header.declared_rom_size << "\n";
    }
}

void report_lock(const CpuState& cpu) {
    std::cerr << "Warning: CPU locked up";
    if (cpu.illegal) {
        std::cerr << " on illegal opcode $" << std::hex << std::uppercase
                  << std::setw(2) << std::setfill('0') << static_cast<int>(cpu.illegal->opcode)
                  << " at $" << std::setw(4) << cpu.illegal->address
                  << std::dec << std::setfill(' ');
    }
    std::cerr << "\n";
}

} // anonymous namespace

template<typename MachineType>
void print_usage(const char* program_name) {
    using Hardware = typename MachineType::Hardware;
    std::cerr << "Usage: " << program_name << " --rom <filepath> [options]\n"
              << "\n"
              << "Machine: " << Hardware::MACHINE_DISPLAY_NAME << "\n"
              << "\n"
              << "Required:\n"
              << "  --rom <filepath>         Cartridge image\n"
              << "\n"
              << "Optional:\n"
              << "  --boot-rom <filepath>    256-byte boot ROM (default: start at $0100)\n"
              << "  --save <filepath>        Battery RAM file (default: ROM name with .sav)\n"
              << "  --rom-dir <dirpath>      ROM directory (auto-detected if not specified)\n"
              << "  --port <port>            gRPC port (default: " << DEFAULT_GRPC_PORT << ")\n"
              << "  --info                   Show machine information and exit\n"
              << "  --help                   Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --rom tetris.gb\n"
              << "  " << program_name << " --rom zelda.gb --save saves/zelda.sav\n";
}

template<typename MachineType>
void print_info(const char* program_name) {
    using Hardware = typename MachineType::Hardware;

    // JSON output for machine discovery
    std::cout << "{\n"
              << "  \"executable\": \"" << program_name << "\",\n"
              << "  \"machine_type\": \"" << Hardware::MACHINE_TYPE << "\",\n"
              << "  \"display_name\": \"" << Hardware::MACHINE_DISPLAY_NAME << "\",\n"
              << "  \"version\": \"" << GBIUM_VERSION << "\",\n"
              << "  \"screen_width\": " << video_constants::FRAME_WIDTH << ",\n"
              << "  \"screen_height\": " << video_constants::FRAME_HEIGHT << ",\n"
              << "  \"framerate_hz\": " << timing::FRAMES_PER_SECOND << "\n"
              << "}\n";
}

template<typename MachineType>
int server_main(int argc, char* argv[]) {
    using Hardware = typename MachineType::Hardware;

    std::string rom_filepath;
    std::string boot_rom_filepath;
    std::string save_filepath;
    std::string rom_dirpath;
    uint16_t port = DEFAULT_GRPC_PORT;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage<MachineType>(argv[0]);
            return 0;
        } else if (arg == "--info") {
            print_info<MachineType>(argv[0]);
            return 0;
        } else if (arg == "--rom" && i + 1 < argc) {
            rom_filepath = argv[++i];
        } else if (arg == "--boot-rom" && i + 1 < argc) {
            boot_rom_filepath = argv[++i];
        } else if (arg == "--save" && i + 1 < argc) {
            save_filepath = argv[++i];
        } else if (arg == "--rom-dir" && i + 1 < argc) {
            rom_dirpath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage<MachineType>(argv[0]);
            return 1;
        }
    }

    if (rom_filepath.empty()) {
        std::cerr << "Error: --rom is required\n\n";
        print_usage<MachineType>(argv[0]);
        return 1;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Set ROM directory if specified
        if (!rom_dirpath.empty()) {
            RomPaths::set_rom_directory(rom_dirpath);
        }

        // Create and initialize machine
        std::cout << "Initializing " << Hardware::MACHINE_DISPLAY_NAME << "...\n";
        MachineType machine;

        if (!boot_rom_filepath.empty()) {
            auto boot_rom_path = RomPaths::find_rom(boot_rom_filepath);
            std::cout << "Loading boot ROM: " << boot_rom_path << "\n";
            machine.load_boot_rom(load_file(boot_rom_path));
        }

        auto rom_path = RomPaths::find_rom(rom_filepath);
        std::cout << "Loading cartridge: " << rom_path << "\n";
        machine.load_cartridge(load_file(rom_path));

        const Cartridge& cartridge = machine.hardware().cartridge;
        report_header(cartridge);

        // Battery RAM
        const bool battery = cartridge.header().has_battery && cartridge.layout().ram_size > 0;
        std::filesystem::path save_path = save_filepath.empty()
            ? RomPaths::default_save_path(rom_path)
            : std::filesystem::path(save_filepath);
        if (battery && std::filesystem::exists(save_path)) {
            std::cout << "Loading battery RAM: " << save_path << "\n";
            machine.load_ram(load_file(save_path));
        }

        // Start gRPC server
        std::cout << "Starting gRPC server on port " << port << "...\n";
        gbium::service::Server server(machine, "0.0.0.0", port);
        server.start();

        std::cout << Hardware::MACHINE_DISPLAY_NAME << " running. Press Ctrl+C to stop.\n";

        // Main emulation loop, paced to the LCD refresh rate
        using clock = std::chrono::steady_clock;
        const auto frame_period = std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(1.0 / timing::FRAMES_PER_SECOND));
        auto next_frame = clock::now();
        bool lock_reported = false;

        while (g_running) {
            // Block if debugger has paused execution
            if (machine.is_paused()) {
                machine.wait_if_paused();
                next_frame = clock::now();
            }

            machine.run_frame();

            if (machine.locked() && !lock_reported) {
                report_lock(machine.cpu());
                lock_reported = true;
            }

            next_frame += frame_period;
            std::this_thread::sleep_until(next_frame);
        }

        std::cout << "\nShutting down...\n";
        server.stop();

        if (battery) {
            std::cout << "Saving battery RAM: " << save_path << "\n";
            save_file(save_path, machine.save_ram());
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace gbium::server

#endif // GBIUM_SERVER_SERVER_MAIN_HPP

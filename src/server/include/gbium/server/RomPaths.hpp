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

#ifndef GBIUM_SERVER_ROM_PATHS_HPP
#define GBIUM_SERVER_ROM_PATHS_HPP

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gbium::server {

// Locates cartridge and boot ROM images.
//
// A bare filename is tried in the current directory, then in each ROM
// directory in turn:
//   1. Directory given with --rom-dir (when given, the only one searched)
//   2. GBIUM_ROM_DIR environment variable
//   3. ../roms relative to the build directory
//   4. ../share/gbium/roms relative to the installed executable
//   5. GBIUM_DEFAULT_ROM_DIR, if compiled in
// A name without an extension also matches "<name>.gb".
class RomPaths {
public:
    static void set_rom_directory(const std::filesystem::path& dirpath) {
        explicit_rom_dirpath_ = dirpath;
    }

    static void clear_rom_directory() {
        explicit_rom_dirpath_.reset();
    }

    // Existing directories in search order
    static std::vector<std::filesystem::path> rom_directories() {
        std::vector<std::filesystem::path> dirpaths;

        if (explicit_rom_dirpath_) {
            if (!std::filesystem::is_directory(*explicit_rom_dirpath_)) {
                throw std::runtime_error(
                    "ROM directory does not exist: " + explicit_rom_dirpath_->string());
            }
            dirpaths.push_back(*explicit_rom_dirpath_);
            return dirpaths;
        }

        auto add_if_directory = [&dirpaths](const std::filesystem::path& dirpath) {
            if (std::filesystem::is_directory(dirpath)) {
                dirpaths.push_back(dirpath);
            }
        };

        if (const char* env_dir = std::getenv("GBIUM_ROM_DIR")) {
            add_if_directory(env_dir);
        }

        const auto exe_dirpath = executable_directory();
        add_if_directory(exe_dirpath.parent_path().parent_path() / "roms");
        add_if_directory(exe_dirpath.parent_path() / "share" / "gbium" / "roms");

#ifdef GBIUM_DEFAULT_ROM_DIR
        add_if_directory(GBIUM_DEFAULT_ROM_DIR);
#endif

        return dirpaths;
    }

    // Throws std::runtime_error naming every place searched
    static std::filesystem::path find_rom(std::string_view filename) {
        const std::filesystem::path filepath(filename);

        if (filepath.is_absolute() || filepath.has_parent_path()) {
            if (auto found = existing_variant(std::filesystem::absolute(filepath))) {
                return *found;
            }
            throw std::runtime_error("ROM file not found: " + filepath.string());
        }

        std::vector<std::filesystem::path> candidates;
        if (!explicit_rom_dirpath_) {
            candidates.push_back(std::filesystem::current_path());
        }
        for (auto& dirpath : rom_directories()) {
            candidates.push_back(std::move(dirpath));
        }

        std::string searched;
        for (const auto& dirpath : candidates) {
            if (auto found = existing_variant(dirpath / filepath)) {
                return *found;
            }
            searched += (searched.empty() ? "" : ", ") + dirpath.string();
        }

        throw std::runtime_error("ROM file not found: " + filepath.string() +
                                 " (searched " + (searched.empty() ? "nowhere" : searched) +
                                 "; set GBIUM_ROM_DIR or use --rom-dir)");
    }

    // Battery save file for a cartridge: same stem, .sav extension
    static std::filesystem::path default_save_path(const std::filesystem::path& rom_filepath) {
        auto save_filepath = rom_filepath;
        save_filepath.replace_extension(".sav");
        return save_filepath;
    }

private:
    static inline std::optional<std::filesystem::path> explicit_rom_dirpath_;

    static std::optional<std::filesystem::path> existing_variant(const std::filesystem::path& filepath) {
        if (std::filesystem::is_regular_file(filepath)) {
            return filepath;
        }
        if (!filepath.has_extension()) {
            auto with_extension = filepath;
            with_extension.replace_extension(".gb");
            if (std::filesystem::is_regular_file(with_extension)) {
                return with_extension;
            }
        }
        return std::nullopt;
    }

    // Directory of the running executable, or the current directory where
    // /proc/self/exe is unavailable
    static std::filesystem::path executable_directory() {
        std::error_code ec;
        auto exe_filepath = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec) {
            return std::filesystem::current_path();
        }
        return exe_filepath.parent_path();
    }
};

} // namespace gbium::server

#endif // GBIUM_SERVER_ROM_PATHS_HPP

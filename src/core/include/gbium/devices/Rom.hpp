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

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>

namespace gbium {

// Fixed-size ROM with compile-time size (the DMG boot ROM).
// Writes are silently ignored. Tracks whether an image has been loaded
// so the hardware can fall back to the post-boot state without one.
template<size_t Size>
class Rom {
    std::array<uint8_t, Size> data_{};
    bool loaded_ = false;

public:
    static constexpr size_t size = Size;

    Rom() { data_.fill(0xFF); }

    explicit Rom(std::span<const uint8_t> src) {
        load(src);
    }

    uint8_t read(uint16_t offset) const {
        return data_[offset % Size];
    }

    void write(uint16_t /*offset*/, uint8_t /*value*/) {
        // ROM: writes are ignored
    }

    const uint8_t* data() const noexcept { return data_.data(); }

    bool loaded() const noexcept { return loaded_; }

    void load(std::span<const uint8_t> src) {
        data_.fill(0xFF);
        size_t copy_len = std::min(src.size(), Size);
        std::copy_n(src.begin(), copy_len, data_.begin());
        loaded_ = !src.empty();
    }

    void unload() {
        data_.fill(0xFF);
        loaded_ = false;
    }
};

} // namespace gbium

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

// Fixed-size RAM (work RAM, VRAM, OAM, high RAM).
// Offsets wrap modulo the size.
template<size_t Size>
class Ram {
    std::array<uint8_t, Size> data_{};

public:
    static constexpr size_t size = Size;

    Ram() = default;

    explicit Ram(uint8_t fill_value) {
        data_.fill(fill_value);
    }

    uint8_t read(uint16_t offset) const {
        return data_[offset % Size];
    }

    void write(uint16_t offset, uint8_t value) {
        data_[offset % Size] = value;
    }

    uint8_t* data() noexcept { return data_.data(); }
    const uint8_t* data() const noexcept { return data_.data(); }

    std::span<const uint8_t> bytes() const noexcept { return data_; }

    // Load bytes at an offset, truncating at the end of the RAM
    void load(std::span<const uint8_t> src, size_t offset = 0) {
        if (offset < Size) {
            size_t copy_len = std::min(src.size(), Size - offset);
            std::copy_n(src.begin(), copy_len, data_.begin() + offset);
        }
    }

    void clear(uint8_t fill_value = 0) {
        data_.fill(fill_value);
    }
};

} // namespace gbium

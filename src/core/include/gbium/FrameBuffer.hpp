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

#ifndef GBIUM_FRAME_BUFFER_HPP
#define GBIUM_FRAME_BUFFER_HPP

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace gbium {

namespace video_constants {
    constexpr size_t FRAME_WIDTH = 160;
    constexpr size_t FRAME_HEIGHT = 144;
    constexpr size_t FRAME_SIZE = FRAME_WIDTH * FRAME_HEIGHT;  // pixels
}

// Classic grey ramp for shades 0 (lightest) to 3 (darkest), as 0xAARRGGBB
constexpr std::array<uint32_t, 4> kShadeArgb = {
    0xFFFFFFFF, 0xFFC0C0C0, 0xFF606060, 0xFF000000
};

constexpr uint32_t shade_to_argb(uint8_t shade) {
    return kShadeArgb[shade & 0x03];
}

// Double-buffered frame of 2-bit shades (palette already applied).
//
// The PPU writes rows into the front buffer as each line's pixel transfer
// completes. At VBlank entry, swap() exchanges front and back buffers.
// Clients read from the back buffer (immutable between swaps).
//
// Thread safety:
// - write_row(): Called only by core (single thread), no lock needed
// - swap(): Called by core at VBlank, acquires lock briefly
// - copy_frame(): Called by clients, acquires lock briefly
// - version(): Lock-free read of atomic counter
//
class FrameBuffer {
public:
    FrameBuffer()
        : front_(video_constants::FRAME_SIZE, 0)
        , back_(video_constants::FRAME_SIZE, 0)
    {}

    // Non-copyable, non-movable
    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;
    FrameBuffer(FrameBuffer&&) = delete;
    FrameBuffer& operator=(FrameBuffer&&) = delete;

    // --- Core interface (called during rendering) ---

    void write_row(size_t y, std::span<const uint8_t> shades) {
        if (y < height() && shades.size() <= width()) {
            std::copy(shades.begin(), shades.end(), front_.begin() + y * width());
        }
    }

    void clear(uint8_t shade = 0) {
        std::fill(front_.begin(), front_.end(), shade);
    }

    // --- Core interface (called at VBlank) ---

    // Publish the completed frame and bump the version counter
    void swap() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(front_, back_);
        version_.fetch_add(1, std::memory_order_release);
    }

    // --- Client interface (called by frontends) ---

    // Last complete frame, row-major, one shade per pixel
    std::vector<uint8_t> copy_frame() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return back_;
    }

    uint8_t pixel(size_t x, size_t y) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return back_[y * width() + x];
    }

    // Incremented each time swap() is called
    uint64_t version() const {
        return version_.load(std::memory_order_acquire);
    }

    // --- Query interface ---

    static constexpr size_t width() { return video_constants::FRAME_WIDTH; }
    static constexpr size_t height() { return video_constants::FRAME_HEIGHT; }
    static constexpr size_t pixel_count() { return video_constants::FRAME_SIZE; }

private:
    std::vector<uint8_t> front_;  // Core writes here during rendering
    std::vector<uint8_t> back_;   // Clients read here (immutable between swaps)

    mutable std::mutex mutex_;
    std::atomic<uint64_t> version_{0};
};

} // namespace gbium

#endif // GBIUM_FRAME_BUFFER_HPP

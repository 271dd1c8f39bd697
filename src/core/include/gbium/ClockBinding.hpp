#pragma once

#include "ClockConcepts.hpp"
#include <cstdint>

namespace gbium {

// ClockBinding wraps a device reference and provides clock dispatch.
// The binding knows the device's rate at compile time.
//
// Dot Clock Model:
// The DMG runs on a 4MHz dot clock. The CPU bus, and everything clocked
// alongside it, runs at a quarter of that rate (one machine cycle):
//
// - Dot-rate devices (PPU): tick every dot
// - Machine-rate devices (timer, serial, OAM DMA): tick every fourth dot
//
// Dot numbering: The dot counter starts at 0 and increments each 4MHz tick.
// Machine-rate devices tick when (dot & 3) == 0, which corresponds to:
//   dot 0, 4, 8, ...  -> machine cycle tick
//   dot 1, 2, 3, 5... -> no machine cycle tick
//
// Machine-rate devices therefore see each machine cycle before the PPU
// advances through its four dots.
template<typename Device>
    requires ClockSubscriber<Device>
struct ClockBinding {
    Device& device;

    static constexpr ClockRate rate = Device::clock_rate;

    void tick() {
        device.tick();
    }

    bool should_tick(uint64_t dot) const {
        if constexpr (rate == ClockRate::Dot) {
            return true;
        } else {
            return (dot & 3) == 0;
        }
    }
};

// Helper to create clock binding with deduced device type
template<ClockSubscriber Device>
constexpr auto make_clock_binding(Device& device) {
    return ClockBinding<Device>{device};
}

} // namespace gbium

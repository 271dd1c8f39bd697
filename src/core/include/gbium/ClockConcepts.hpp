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

#include "ClockTypes.hpp"
#include <concepts>
#include <type_traits>

namespace gbium {

// Concept: Device declares its clock rate via static member
template<typename T>
concept HasStaticClockRate = requires {
    { T::clock_rate } -> std::convertible_to<ClockRate>;
};

// Concept: Device has tick() method
template<typename T>
concept HasTick = requires(T& device) {
    { device.tick() } -> std::same_as<void>;
};

// Main concept: A valid clock subscriber
// - Must declare clock_rate
// - Must have tick()
template<typename T>
concept ClockSubscriber = HasStaticClockRate<T> && HasTick<T>;

// Concept: Subscriber ticked once per machine cycle
template<typename T>
concept MachineRateSubscriber = ClockSubscriber<T> && (T::clock_rate == ClockRate::Machine);

// Concept: Subscriber ticked on every dot
template<typename T>
concept DotRateSubscriber = ClockSubscriber<T> && (T::clock_rate == ClockRate::Dot);

} // namespace gbium

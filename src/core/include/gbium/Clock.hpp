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

#include "ClockBinding.hpp"
#include <tuple>
#include <cstddef>
#include <cstdint>

namespace gbium {

namespace detail {

// Recursive dispatch in binding order
template<std::size_t I, typename Tuple>
void dispatch_tick(Tuple& bindings, uint64_t dot) {
    if constexpr (I < std::tuple_size_v<Tuple>) {
        auto& binding = std::get<I>(bindings);
        if (binding.should_tick(dot)) {
            binding.tick();
        }
        dispatch_tick<I + 1>(bindings, dot);
    }
}

} // namespace detail

// Clock template - holds bindings to all subscribed devices
// Devices are ticked at their declared rates, in the order given
//
// Usage:
//   auto clock = make_clock(
//       make_clock_binding(timer_binding),
//       make_clock_binding(dma_binding),
//       make_clock_binding(video_binding)
//   );
//   clock.tick(dot_count);
//
template<typename... Bindings>
class Clock {
    std::tuple<Bindings...> bindings_;

public:
    explicit Clock(Bindings... bindings)
        : bindings_{std::move(bindings)...} {}

    // Tick all subscribers for the given dot
    void tick(uint64_t dot) {
        detail::dispatch_tick<0>(bindings_, dot);
    }

    // Tick one machine cycle (four dots) starting at an aligned dot
    void tick_machine_cycle(uint64_t first_dot) {
        for (uint64_t d = 0; d < timing::DOTS_PER_MACHINE_CYCLE; ++d) {
            tick(first_dot + d);
        }
    }

    // Access specific binding by index (for testing/debugging)
    template<std::size_t I>
    auto& get() { return std::get<I>(bindings_); }

    template<std::size_t I>
    const auto& get() const { return std::get<I>(bindings_); }

    // Number of subscribers
    static constexpr std::size_t size() { return sizeof...(Bindings); }
};

// Deduction guide for Clock
template<typename... Bindings>
Clock(Bindings...) -> Clock<Bindings...>;

// Helper to create clock with bindings
template<typename... Bindings>
constexpr auto make_clock(Bindings... bindings) {
    return Clock<Bindings...>{std::move(bindings)...};
}

} // namespace gbium

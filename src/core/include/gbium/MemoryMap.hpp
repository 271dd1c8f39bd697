#pragma once

#include "Types.hpp"

#include <cstdint>
#include <concepts>
#include <tuple>
#include <type_traits>
#include <utility>

namespace gbium {

// Concept for any device that can be memory-mapped
template<typename T>
concept MemoryMappedDevice = requires(T& device, uint16_t offset, uint8_t value) {
    { device.read(offset) } -> std::convertible_to<uint8_t>;
    { device.write(offset, value) } -> std::same_as<void>;
};

// Devices whose bus read differs from their stored value (access blocking)
// expose peek() for debugger inspection.
template<typename T>
concept PeekableDevice = requires(const T& device, uint16_t offset) {
    { device.peek(offset) } -> std::convertible_to<uint8_t>;
};

// Mirror policies: reduce the region offset before it reaches the device

struct NoMirror {
    static constexpr uint16_t apply(uint16_t offset) noexcept { return offset; }
};

template<uint16_t Mask>
struct Mirror {
    static constexpr uint16_t apply(uint16_t offset) noexcept { return offset & Mask; }
};

// Binds an inclusive address range to a device; the device sees offsets from Base
template<uint16_t Base, uint16_t End, typename MirrorPolicy = NoMirror>
struct Region {
    static_assert(Base <= End, "Region base must be <= end");

    static constexpr uint16_t base = Base;
    static constexpr uint16_t end = End;
    static constexpr uint32_t size = uint32_t{End} - Base + 1;

    template<MemoryMappedDevice Device>
    struct Binding {
        Device& device;

        constexpr bool contains(uint16_t addr) const noexcept {
            return addr >= Base && addr <= End;
        }

        uint8_t read(uint16_t addr) const {
            return device.read(MirrorPolicy::apply(addr - Base));
        }

        uint8_t peek(uint16_t addr) const {
            if constexpr (PeekableDevice<Device>) {
                return device.peek(MirrorPolicy::apply(addr - Base));
            } else {
                return device.read(MirrorPolicy::apply(addr - Base));
            }
        }

        void write(uint16_t addr, uint8_t value) {
            device.write(MirrorPolicy::apply(addr - Base), value);
        }
    };

    template<MemoryMappedDevice Device>
    static constexpr Binding<Device> bind(Device& device) {
        return Binding<Device>{device};
    }
};

// make_region<0xC000, 0xDFFF>(wram)
template<uint16_t Base, uint16_t End, typename MirrorPolicy = NoMirror, MemoryMappedDevice Device>
constexpr auto make_region(Device& device) {
    return Region<Base, End, MirrorPolicy>::bind(device);
}

namespace detail {

// Apply `access` to the first region containing addr; `unmapped` otherwise
template<size_t I, typename Tuple, typename Access, typename Unmapped>
decltype(auto) visit_first(Tuple& regions, uint16_t addr, Access&& access, Unmapped&& unmapped) {
    if constexpr (I < std::tuple_size_v<std::remove_const_t<Tuple>>) {
        auto& region = std::get<I>(regions);
        if (region.contains(addr)) {
            return access(region);
        }
        return visit_first<I + 1>(regions, addr, std::forward<Access>(access),
                                  std::forward<Unmapped>(unmapped));
    } else {
        return unmapped();
    }
}

} // namespace detail

// Variadic composition of region bindings. The first region containing an
// address handles it, so overlays (boot ROM) are listed before what they cover.
template<typename... RegionBindings>
class MemoryMap {
    std::tuple<RegionBindings...> regions_;

public:
    explicit MemoryMap(RegionBindings... regions)
        : regions_{std::move(regions)...} {}

    uint8_t read(uint16_t addr) const {
        return detail::visit_first<0>(regions_, addr,
            [addr](const auto& region) -> uint8_t { return region.read(addr); },
            []() -> uint8_t { return kOpenBus; });
    }

    // Writes outside every region are dropped
    void write(uint16_t addr, uint8_t value) {
        detail::visit_first<0>(regions_, addr,
            [addr, value](auto& region) { region.write(addr, value); },
            []() {});
    }

    // Stored value, ignoring PPU and DMA access blocking
    uint8_t peek(uint16_t addr) const {
        return detail::visit_first<0>(regions_, addr,
            [addr](const auto& region) -> uint8_t { return region.peek(addr); },
            []() -> uint8_t { return kOpenBus; });
    }
};

template<typename... RegionBindings>
MemoryMap(RegionBindings...) -> MemoryMap<RegionBindings...>;

} // namespace gbium

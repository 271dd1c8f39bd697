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

#ifndef GBIUM_MACHINE_HPP
#define GBIUM_MACHINE_HPP

#include "Cartridge.hpp"
#include "Clock.hpp"
#include "ClockBinding.hpp"
#include "CpuBinding.hpp"
#include "CpuState.hpp"
#include "Joypad.hpp"
#include "OamDma.hpp"
#include "Ppu.hpp"
#include "Serial.hpp"
#include "Sm83.hpp"
#include "Timer.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <stdexcept>
#include <vector>

namespace gbium {

// Watchpoint callback: addr, value, is_write, cycle
using WatchCallback = std::function<void(uint16_t addr, uint8_t value, bool is_write, uint64_t cycle)>;

// PC callback: called before each instruction executes
using InstructionCallback = std::function<bool(uint16_t pc, uint64_t cycle)>;  // return false to stop

// Sound register write, stamped with the machine cycle it happened on
using AudioCallback = std::function<void(uint16_t addr, uint8_t value, uint64_t cycle)>;

// Simple watchpoint structure
struct Watchpoint {
    uint32_t start_addr;
    uint32_t end_addr;  // exclusive, allows 0x10000 for full address space
    WatchType type;
    WatchCallback callback;

    Watchpoint(uint32_t start, uint32_t end, WatchType t, WatchCallback cb)
        : start_addr(start), end_addr(end), type(t), callback(std::move(cb))
    {
        if (start_addr > 0xFFFF || end_addr > 0x10000 || start_addr >= end_addr) {
            throw std::out_of_range("watchpoint range outside the address space");
        }
    }

    bool matches(uint16_t addr, bool is_write) const {
        if (addr < start_addr || addr >= end_addr) return false;
        if (is_write && (type & WATCH_WRITE)) return true;
        if (!is_write && (type & WATCH_READ)) return true;
        return false;
    }
};

// Machine state: CPU registers, every device, and the cycle counter.
template<typename HardwarePolicy>
struct MachineState {
    CpuState cpu{};
    HardwarePolicy hardware;
    uint64_t cycle_count = 0;   // Machine cycles since reset
};

// Step driver, parameterized by the hardware configuration.
//
// HardwarePolicy must provide:
//   - irq, timer, joypad, serial, dma, ppu, cartridge, audio members
//   - cpu_read()/cpu_write() (CPU bus), read()/write()/peek() (debugger)
//   - dma_read()/oam_write() (DmaBus), enter_stop(), ppu_context()
//   - reset(), apply_post_boot_state(), boot_rom_mapped
//
// Each machine cycle the clock ticks, in order: timer, joypad, serial,
// OAM DMA, then four PPU dots. The CPU core is built around the state for
// every step; it holds no state of its own.
//
template<typename HardwarePolicy>
class Machine {
public:
    using Hardware = HardwarePolicy;
    using State = MachineState<HardwarePolicy>;
    using DmaBindingType = DmaBinding<HardwarePolicy>;

    // System clock type: timer, joypad, serial and DMA per machine cycle,
    // the PPU per dot
    using SystemClockType = Clock<
        ClockBinding<TimerBinding>,
        ClockBinding<JoypadBinding>,
        ClockBinding<SerialBinding>,
        ClockBinding<DmaBindingType>,
        ClockBinding<VideoBinding>
    >;

    using CpuBindingType = CpuBinding<HardwarePolicy, SystemClockType>;
    using Cpu = Sm83<CpuBindingType>;

    Machine()
        : state_()
        , timer_binding_{state_.hardware.timer, state_.hardware.irq}
        , joypad_binding_{state_.hardware.joypad, state_.hardware.irq}
        , serial_binding_{state_.hardware.serial, state_.hardware.irq}
        , dma_binding_{state_.hardware.dma, state_.hardware}
        , video_binding_{state_.hardware.ppu, state_.hardware.ppu_context()}
        , system_clock_(make_system_clock())
        , cpu_binding_(state_.hardware, system_clock_, state_.cycle_count)
    {
        setup_callbacks();
        reset();
    }

    // Non-copyable (bindings refer into state_)
    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // Reset to power-on state. Without a boot ROM the registers the boot
    // ROM would have left are applied directly and execution starts at 0x0100.
    void reset() {
        state_.hardware.reset();
        if (state_.hardware.boot_rom_mapped) {
            state_.cpu.reset();
        } else {
            state_.cpu.apply_post_boot();
            state_.hardware.apply_post_boot_state();
        }
        state_.cycle_count = 0;
        applied_buttons_ = 0;
        ++sequence_;
    }

    // Insert a cartridge image and reset.
    // Throws CartridgeError if the image is rejected; the machine is unchanged.
    void load_cartridge(std::vector<uint8_t> rom) {
        state_.hardware.insert_cartridge(Cartridge::from_rom(std::move(rom)));
        reset();
    }

    // Install a 256-byte boot ROM and reset into it
    void load_boot_rom(std::span<const uint8_t> data) {
        state_.hardware.load_boot_rom(data);
        reset();
    }

    // Execute one instruction (or one halted cycle, or one interrupt dispatch)
    // Returns the number of machine cycles taken
    uint32_t step_instruction() {
        sync_buttons();
        Cpu cpu(state_.cpu, cpu_binding_);
        const uint32_t cycles = cpu.step();
        ++sequence_;
        return cycles;
    }

    // Execute for at least the given number of machine cycles
    void run(uint64_t cycles) {
        const uint64_t target = state_.cycle_count + cycles;
        while (state_.cycle_count < target) {
            step_instruction();
        }
    }

    // Run until the PPU enters VBlank. Returns true when a frame completed;
    // false if the instruction callback requested a stop, the machine was
    // paused, or the LCD is off and a frame's worth of cycles has elapsed.
    bool run_frame() {
        ActiveFrame active(*this);
        if (paused_.load()) {
            return false;
        }
        return run_to_vblank(true);
    }

    // As run_frame(), ignoring the instruction callback and pause requests
    bool step_frame() {
        return run_to_vblank(false);
    }

    // Execute one complete instruction with optional callback
    // Returns false if callback requested stop, true otherwise
    bool step_instruction_debug() {
        if (on_instruction_) {
            if (!on_instruction_(state_.cpu.pc, state_.cycle_count)) {
                return false;  // Callback requested stop
            }
        }
        step_instruction();
        return true;
    }

    // State access
    const State& state() const { return state_; }
    State& state() { return state_; }

    // CPU access
    const CpuState& cpu() const { return state_.cpu; }
    CpuState& cpu() { return state_.cpu; }

    // Hardware access
    const HardwarePolicy& hardware() const { return state_.hardware; }
    HardwarePolicy& hardware() { return state_.hardware; }

    // Frame output
    const FrameBuffer& frame_buffer() const { return state_.hardware.frame_buffer; }
    FrameBuffer& frame_buffer() { return state_.hardware.frame_buffer; }

    // Cycle counter
    uint64_t cycle_count() const { return state_.cycle_count; }

    // Sequence counter (increments on any mutation, for change detection)
    uint64_t sequence() const { return sequence_.load(); }

    // True once an illegal opcode has locked the CPU
    bool locked() const { return state_.cpu.mode == CpuMode::Locked; }

    // Debug pause/resume for debugger integration
    bool is_paused() const { return paused_.load(); }

    void pause() {
        paused_.store(true);
        ++sequence_;
    }

    void resume() {
        {
            std::lock_guard<std::mutex> lock(debug_mutex_);
            paused_.store(false);
        }
        debug_cv_.notify_all();
        ++sequence_;
    }

    // Pause, then block until a run_frame() in progress on another thread has
    // returned. Must not be called from the emulation thread.
    void pause_and_wait() {
        pause();
        std::unique_lock<std::mutex> lock(debug_mutex_);
        debug_cv_.wait(lock, [this] { return !frame_active_.load(); });
    }

    // Paused with no run_frame() executing: state may be read and modified
    // from another thread
    bool is_stopped() const { return paused_.load() && !frame_active_.load(); }

    // Block until not paused - call from emulation loop
    void wait_if_paused() {
        if (paused_.load()) {
            std::unique_lock<std::mutex> lock(debug_mutex_);
            debug_cv_.wait(lock, [this] { return !paused_.load(); });
        }
    }

    // Input. Safe to call from any thread; applied before the next instruction.
    void set_button(Button button, bool pressed) {
        const auto bit = static_cast<uint8_t>(1u << static_cast<uint8_t>(button));
        if (pressed) {
            buttons_.fetch_or(bit);
        } else {
            buttons_.fetch_and(static_cast<uint8_t>(~bit));
        }
    }

    uint8_t buttons() const { return buttons_.load(); }

    // Battery-backed cartridge RAM
    std::vector<uint8_t> save_ram() const { return state_.hardware.cartridge.save_ram(); }

    void load_ram(std::span<const uint8_t> data) {
        state_.hardware.cartridge.load_ram(data);
        ++sequence_;
    }

    // Sound register writes, forwarded with their cycle stamp
    void set_audio_callback(AudioCallback cb) { audio_callback_ = std::move(cb); }

    // CPU register accessors (debugger convenience)
    uint8_t a() const { return state_.cpu.a; }
    uint8_t f() const { return state_.cpu.f; }
    uint8_t b() const { return state_.cpu.b; }
    uint8_t c() const { return state_.cpu.c; }
    uint8_t d() const { return state_.cpu.d; }
    uint8_t e() const { return state_.cpu.e; }
    uint8_t h() const { return state_.cpu.h; }
    uint8_t l() const { return state_.cpu.l; }
    uint16_t sp() const { return state_.cpu.sp; }
    uint16_t pc() const { return state_.cpu.pc; }
    bool ime() const { return state_.cpu.ime; }

    // CPU register setters (for debugger) - each increments sequence_
    void set_a(uint8_t value) { state_.cpu.a = value; ++sequence_; }
    void set_f(uint8_t value) { state_.cpu.f = value & 0xF0; ++sequence_; }
    void set_b(uint8_t value) { state_.cpu.b = value; ++sequence_; }
    void set_c(uint8_t value) { state_.cpu.c = value; ++sequence_; }
    void set_d(uint8_t value) { state_.cpu.d = value; ++sequence_; }
    void set_e(uint8_t value) { state_.cpu.e = value; ++sequence_; }
    void set_h(uint8_t value) { state_.cpu.h = value; ++sequence_; }
    void set_l(uint8_t value) { state_.cpu.l = value; ++sequence_; }
    void set_sp(uint16_t value) { state_.cpu.sp = value; ++sequence_; }
    void set_pc(uint16_t value) { state_.cpu.pc = value; ++sequence_; }
    void set_ime(bool value) { state_.cpu.ime = value; ++sequence_; }

    // Direct memory access (no CPU bus contention, no clock advance)
    uint8_t read(uint16_t addr) const { return state_.hardware.read(addr); }
    void write(uint16_t addr, uint8_t value) { state_.hardware.write(addr, value); ++sequence_; }

    // Stored value, ignoring PPU and DMA access blocking
    uint8_t peek(uint16_t addr) const { return state_.hardware.peek(addr); }

    // Watchpoint management
    void add_watchpoint(uint32_t addr, uint32_t length, WatchType type, WatchCallback callback) {
        watchpoints_.emplace_back(addr, addr + length, type, std::move(callback));
    }

    void clear_watchpoints() { watchpoints_.clear(); }

    const std::vector<Watchpoint>& watchpoints() const { return watchpoints_; }

    // Instruction callback
    void set_instruction_callback(InstructionCallback cb) { on_instruction_ = std::move(cb); }

    void clear_callbacks() {
        on_instruction_ = nullptr;
        watchpoints_.clear();
        audio_callback_ = nullptr;
    }

    // Access to bindings for testing/debugging
    CpuBindingType& cpu_binding() { return cpu_binding_; }
    SystemClockType& system_clock() { return system_clock_; }

private:
    State state_;
    TimerBinding timer_binding_;
    JoypadBinding joypad_binding_;
    SerialBinding serial_binding_;
    DmaBindingType dma_binding_;
    VideoBinding video_binding_;
    SystemClockType system_clock_;
    CpuBindingType cpu_binding_;

    std::vector<Watchpoint> watchpoints_;
    InstructionCallback on_instruction_;
    AudioCallback audio_callback_;

    // Host-side button state, and what the joypad has been told so far
    std::atomic<uint8_t> buttons_{0};
    uint8_t applied_buttons_ = 0;

    // Debug pause/resume state (for debugger attach)
    mutable std::mutex debug_mutex_;
    std::condition_variable debug_cv_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> frame_active_{false};  // Set before paused_ is checked
    std::atomic<uint64_t> sequence_{0};  // Increments on any mutation

    SystemClockType make_system_clock() {
        return make_clock(
            make_clock_binding(timer_binding_),
            make_clock_binding(joypad_binding_),
            make_clock_binding(serial_binding_),
            make_clock_binding(dma_binding_),
            make_clock_binding(video_binding_)
        );
    }

    struct ActiveFrame {
        Machine& machine;
        explicit ActiveFrame(Machine& m) : machine(m) { machine.frame_active_.store(true); }
        ~ActiveFrame() {
            {
                std::lock_guard<std::mutex> lock(machine.debug_mutex_);
                machine.frame_active_.store(false);
            }
            machine.debug_cv_.notify_all();
        }
    };

    bool run_to_vblank(bool debug) {
        const uint64_t start = state_.cycle_count;
        state_.hardware.ppu.take_frame_ready();
        for (;;) {
            if (debug) {
                if (paused_.load() || !step_instruction_debug()) {
                    return false;
                }
            } else {
                step_instruction();
            }
            if (state_.hardware.ppu.take_frame_ready()) {
                return true;
            }
            if (!state_.hardware.ppu.lcd_enabled() &&
                state_.cycle_count - start >= timing::CYCLES_PER_FRAME) {
                return false;
            }
        }
    }

    void sync_buttons() {
        const uint8_t wanted = buttons_.load();
        if (wanted == applied_buttons_) {
            return;
        }
        for (uint8_t i = 0; i < kButtonCount; ++i) {
            state_.hardware.joypad.set_button(static_cast<Button>(i), (wanted >> i) & 1);
        }
        applied_buttons_ = wanted;
    }

    void setup_callbacks() {
        // Watchpoint callback - dispatches to watchpoints vector
        cpu_binding_.set_watchpoint_callback(
            [this](uint16_t addr, uint8_t value, bool is_write) {
                for (const auto& wp : watchpoints_) {
                    if (wp.matches(addr, is_write)) {
                        wp.callback(addr, value, is_write, state_.cycle_count);
                    }
                }
            }
        );

        state_.hardware.audio.set_write_callback(
            [this](uint16_t addr, uint8_t value) {
                if (audio_callback_) {
                    audio_callback_(addr, value, state_.cycle_count);
                }
            }
        );
    }
};

} // namespace gbium

#endif // GBIUM_MACHINE_HPP

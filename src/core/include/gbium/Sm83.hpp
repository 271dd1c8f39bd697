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

#ifndef GBIUM_SM83_HPP
#define GBIUM_SM83_HPP

#include "CpuState.hpp"
#include "InterruptController.hpp"
#include <concepts>
#include <cstdint>

namespace gbium {

// What the CPU needs from the system. Each read(), write() and idle()
// is exactly one machine cycle: the bus advances the clock, then performs
// the access.
template<typename T>
concept Sm83Bus = requires(T& bus, uint16_t addr, uint8_t value) {
    { bus.read(addr) } -> std::convertible_to<uint8_t>;
    { bus.write(addr, value) } -> std::same_as<void>;
    { bus.idle() } -> std::same_as<void>;
    { bus.interrupts() } -> std::same_as<InterruptController&>;
    { bus.stop() } -> std::same_as<void>;
    { bus.stop_wake() } -> std::convertible_to<bool>;
};

// SM83 interpreter over a CpuState and a bus.
//
// Holds references only, so it is cheap to construct around the state for
// each step. step() runs one unit of work:
//   - one instruction (including any pending EI promotion),
//   - one interrupt dispatch (5 cycles, 6 when leaving HALT),
//   - or one idle cycle while halted, stopped or locked.
//
// Opcodes are decoded by their octal fields:
//   x = op[7:6], y = op[5:3], z = op[2:0], p = y >> 1, q = y & 1
//
template<Sm83Bus Bus>
class Sm83 {
public:
    Sm83(CpuState& state, Bus& bus)
        : s_(state), bus_(bus) {}

    // Returns the machine cycles consumed
    uint32_t step() {
        cycles_ = 0;
        InterruptController& irq = bus_.interrupts();

        switch (s_.mode) {
        case CpuMode::Locked:
            idle();
            return cycles_;

        case CpuMode::Stopped:
            if (!bus_.stop_wake()) {
                idle();
                return cycles_;
            }
            s_.mode = CpuMode::Running;
            break;

        case CpuMode::Halted:
            if (!irq.wake_pending()) {
                idle();
                return cycles_;
            }
            s_.mode = CpuMode::Running;
            if (s_.ime) {
                idle();   // Wake-up cycle
                dispatch_interrupt();
                return cycles_;
            }
            break;

        case CpuMode::Running:
            break;
        }

        if (s_.ime && irq.pending()) {
            dispatch_interrupt();
            return cycles_;
        }

        if (s_.ime_pending) {
            s_.ime_pending = false;
            s_.ime = true;
        }

        execute(fetch_opcode());
        return cycles_;
    }

private:
    CpuState& s_;
    Bus& bus_;
    uint32_t cycles_ = 0;
    uint16_t opcode_pc_ = 0;

    //////////////////////////////////////////////////////////////////////////
    // Bus cycles
    //////////////////////////////////////////////////////////////////////////

    uint8_t read(uint16_t addr) {
        ++cycles_;
        return bus_.read(addr);
    }

    void write(uint16_t addr, uint8_t value) {
        ++cycles_;
        bus_.write(addr, value);
    }

    void idle() {
        ++cycles_;
        bus_.idle();
    }

    uint8_t fetch_opcode() {
        opcode_pc_ = s_.pc;
        const uint8_t op = read(s_.pc);
        if (s_.halt_bug) {
            s_.halt_bug = false;
        } else {
            ++s_.pc;
        }
        return op;
    }

    uint8_t fetch() {
        return read(s_.pc++);
    }

    uint16_t fetch16() {
        const uint8_t lo = fetch();
        const uint8_t hi = fetch();
        return static_cast<uint16_t>((hi << 8) | lo);
    }

    void push16(uint16_t value) {
        --s_.sp;
        write(s_.sp, static_cast<uint8_t>(value >> 8));
        --s_.sp;
        write(s_.sp, static_cast<uint8_t>(value & 0xFF));
    }

    uint16_t pop16() {
        const uint8_t lo = read(s_.sp++);
        const uint8_t hi = read(s_.sp++);
        return static_cast<uint16_t>((hi << 8) | lo);
    }

    //////////////////////////////////////////////////////////////////////////
    // Interrupts
    //////////////////////////////////////////////////////////////////////////

    // The highest-priority request is chosen after the high byte of PC is
    // pushed, so a push that lands on IE can cancel dispatch; PC then
    // becomes 0x0000.
    void dispatch_interrupt() {
        InterruptController& irq = bus_.interrupts();
        s_.ime = false;

        idle();
        idle();
        --s_.sp;
        write(s_.sp, static_cast<uint8_t>(s_.pc >> 8));

        const auto kind = irq.pending();

        --s_.sp;
        write(s_.sp, static_cast<uint8_t>(s_.pc & 0xFF));

        if (kind) {
            irq.acknowledge(*kind);
            s_.pc = interrupt_vector(*kind);
        } else {
            s_.pc = 0x0000;
        }
        idle();
    }

    //////////////////////////////////////////////////////////////////////////
    // Operands
    //////////////////////////////////////////////////////////////////////////

    // r[i]: B C D E H L (HL) A
    uint8_t get_r8(uint8_t index) {
        switch (index) {
            case 0: return s_.b;
            case 1: return s_.c;
            case 2: return s_.d;
            case 3: return s_.e;
            case 4: return s_.h;
            case 5: return s_.l;
            case 6: return read(s_.hl());
            default: return s_.a;
        }
    }

    void set_r8(uint8_t index, uint8_t value) {
        switch (index) {
            case 0: s_.b = value; break;
            case 1: s_.c = value; break;
            case 2: s_.d = value; break;
            case 3: s_.e = value; break;
            case 4: s_.h = value; break;
            case 5: s_.l = value; break;
            case 6: write(s_.hl(), value); break;
            default: s_.a = value; break;
        }
    }

    // rp[p]: BC DE HL SP
    uint16_t get_rp(uint8_t p) const {
        switch (p) {
            case 0: return s_.bc();
            case 1: return s_.de();
            case 2: return s_.hl();
            default: return s_.sp;
        }
    }

    void set_rp(uint8_t p, uint16_t value) {
        switch (p) {
            case 0: s_.set_bc(value); break;
            case 1: s_.set_de(value); break;
            case 2: s_.set_hl(value); break;
            default: s_.sp = value; break;
        }
    }

    // rp2[p]: BC DE HL AF
    uint16_t get_rp2(uint8_t p) const {
        return p == 3 ? s_.af() : get_rp(p);
    }

    void set_rp2(uint8_t p, uint16_t value) {
        if (p == 3) {
            s_.set_af(value);
        } else {
            set_rp(p, value);
        }
    }

    // cc[i]: NZ Z NC C
    bool condition(uint8_t index) const {
        switch (index & 0x03) {
            case 0: return !zero();
            case 1: return zero();
            case 2: return !carry();
            default: return carry();
        }
    }

    bool zero() const { return (s_.f & Flags::Z) != 0; }
    bool carry() const { return (s_.f & Flags::C) != 0; }
    bool subtract() const { return (s_.f & Flags::N) != 0; }
    bool half_carry() const { return (s_.f & Flags::H) != 0; }

    void set_flags(bool z, bool n, bool h, bool c) {
        s_.f = Flags{z, n, h, c}.to_byte();
    }

    //////////////////////////////////////////////////////////////////////////
    // Arithmetic
    //////////////////////////////////////////////////////////////////////////

    void add8(uint8_t value, bool carry_in) {
        const unsigned c = carry_in ? 1 : 0;
        const unsigned result = s_.a + value + c;
        set_flags((result & 0xFF) == 0, false,
                  ((s_.a & 0x0F) + (value & 0x0F) + c) > 0x0F,
                  result > 0xFF);
        s_.a = static_cast<uint8_t>(result);
    }

    uint8_t sub8(uint8_t value, bool carry_in) {
        const int c = carry_in ? 1 : 0;
        const int result = s_.a - value - c;
        set_flags((result & 0xFF) == 0, true,
                  ((s_.a & 0x0F) - (value & 0x0F) - c) < 0,
                  result < 0);
        return static_cast<uint8_t>(result);
    }

    // alu[y]: ADD ADC SUB SBC AND XOR OR CP
    void alu(uint8_t op, uint8_t value) {
        switch (op) {
        case 0: add8(value, false); break;
        case 1: add8(value, carry()); break;
        case 2: s_.a = sub8(value, false); break;
        case 3: s_.a = sub8(value, carry()); break;
        case 4:
            s_.a &= value;
            set_flags(s_.a == 0, false, true, false);
            break;
        case 5:
            s_.a ^= value;
            set_flags(s_.a == 0, false, false, false);
            break;
        case 6:
            s_.a |= value;
            set_flags(s_.a == 0, false, false, false);
            break;
        default:
            sub8(value, false);
            break;
        }
    }

    uint8_t inc8(uint8_t value) {
        const uint8_t result = static_cast<uint8_t>(value + 1);
        set_flags(result == 0, false, (value & 0x0F) == 0x0F, carry());
        return result;
    }

    uint8_t dec8(uint8_t value) {
        const uint8_t result = static_cast<uint8_t>(value - 1);
        set_flags(result == 0, true, (value & 0x0F) == 0x00, carry());
        return result;
    }

    void add_hl(uint16_t value) {
        const uint16_t hl = s_.hl();
        const unsigned result = hl + value;
        set_flags(zero(), false, ((hl & 0x0FFF) + (value & 0x0FFF)) > 0x0FFF, result > 0xFFFF);
        s_.set_hl(static_cast<uint16_t>(result));
    }

    // SP + e with flags from the unsigned low-byte addition
    uint16_t add_sp_offset(uint8_t offset) {
        const uint16_t sp = s_.sp;
        set_flags(false, false,
                  ((sp & 0x0F) + (offset & 0x0F)) > 0x0F,
                  ((sp & 0xFF) + offset) > 0xFF);
        return static_cast<uint16_t>(sp + static_cast<int8_t>(offset));
    }

    void daa() {
        uint8_t a = s_.a;
        bool c = carry();
        if (!subtract()) {
            if (c || a > 0x99) {
                a = static_cast<uint8_t>(a + 0x60);
                c = true;
            }
            if (half_carry() || (a & 0x0F) > 0x09) {
                a = static_cast<uint8_t>(a + 0x06);
            }
        } else {
            if (c) {
                a = static_cast<uint8_t>(a - 0x60);
            }
            if (half_carry()) {
                a = static_cast<uint8_t>(a - 0x06);
            }
        }
        s_.a = a;
        set_flags(a == 0, subtract(), false, c);
    }

    // rot[y]: RLC RRC RL RR SLA SRA SWAP SRL
    uint8_t rotate_shift(uint8_t op, uint8_t value) {
        uint8_t result;
        bool c;
        switch (op) {
        case 0:
            c = (value & 0x80) != 0;
            result = static_cast<uint8_t>((value << 1) | (c ? 1 : 0));
            break;
        case 1:
            c = (value & 0x01) != 0;
            result = static_cast<uint8_t>((value >> 1) | (c ? 0x80 : 0));
            break;
        case 2:
            c = (value & 0x80) != 0;
            result = static_cast<uint8_t>((value << 1) | (carry() ? 1 : 0));
            break;
        case 3:
            c = (value & 0x01) != 0;
            result = static_cast<uint8_t>((value >> 1) | (carry() ? 0x80 : 0));
            break;
        case 4:
            c = (value & 0x80) != 0;
            result = static_cast<uint8_t>(value << 1);
            break;
        case 5:
            c = (value & 0x01) != 0;
            result = static_cast<uint8_t>((value >> 1) | (value & 0x80));
            break;
        case 6:
            c = false;
            result = static_cast<uint8_t>((value << 4) | (value >> 4));
            break;
        default:
            c = (value & 0x01) != 0;
            result = static_cast<uint8_t>(value >> 1);
            break;
        }
        set_flags(result == 0, false, false, c);
        return result;
    }

    //////////////////////////////////////////////////////////////////////////
    // Control flow
    //////////////////////////////////////////////////////////////////////////

    void jump_relative(bool taken) {
        const auto offset = static_cast<int8_t>(fetch());
        if (taken) {
            idle();
            s_.pc = static_cast<uint16_t>(s_.pc + offset);
        }
    }

    void jump_absolute(bool taken) {
        const uint16_t target = fetch16();
        if (taken) {
            idle();
            s_.pc = target;
        }
    }

    void call(bool taken) {
        const uint16_t target = fetch16();
        if (taken) {
            idle();
            push16(s_.pc);
            s_.pc = target;
        }
    }

    void ret() {
        s_.pc = pop16();
        idle();
    }

    void rst(uint16_t vector) {
        idle();
        push16(s_.pc);
        s_.pc = vector;
    }

    void halt() {
        if (!s_.ime && bus_.interrupts().wake_pending()) {
            s_.halt_bug = true;
        } else {
            s_.mode = CpuMode::Halted;
        }
    }

    void stop() {
        ++s_.pc;   // Padding byte
        bus_.stop();
        s_.mode = CpuMode::Stopped;
    }

    void lock_up(uint8_t op) {
        s_.mode = CpuMode::Locked;
        s_.illegal = IllegalOpcode{op, opcode_pc_};
    }

    //////////////////////////////////////////////////////////////////////////
    // Decode
    //////////////////////////////////////////////////////////////////////////

    void execute(uint8_t op) {
        const uint8_t x = op >> 6;
        const uint8_t y = (op >> 3) & 0x07;
        const uint8_t z = op & 0x07;

        switch (x) {
        case 0:
            execute_block0(op, y, z);
            break;
        case 1:
            if (op == 0x76) {
                halt();
            } else {
                set_r8(y, get_r8(z));
            }
            break;
        case 2:
            alu(y, get_r8(z));
            break;
        default:
            execute_block3(op, y, z);
            break;
        }
    }

    void execute_block0(uint8_t /*op*/, uint8_t y, uint8_t z) {
        const uint8_t p = y >> 1;
        const bool q = (y & 1) != 0;

        switch (z) {
        case 0:
            switch (y) {
            case 0:   // NOP
                break;
            case 1: { // LD (nn),SP
                const uint16_t addr = fetch16();
                write(addr, static_cast<uint8_t>(s_.sp & 0xFF));
                write(static_cast<uint16_t>(addr + 1), static_cast<uint8_t>(s_.sp >> 8));
                break;
            }
            case 2:
                stop();
                break;
            case 3:
                jump_relative(true);
                break;
            default:
                jump_relative(condition(y - 4));
                break;
            }
            break;

        case 1:
            if (!q) {
                set_rp(p, fetch16());
            } else {
                idle();
                add_hl(get_rp(p));
            }
            break;

        case 2: {
            uint16_t addr;
            switch (p) {
                case 0: addr = s_.bc(); break;
                case 1: addr = s_.de(); break;
                case 2: addr = s_.hl(); s_.set_hl(static_cast<uint16_t>(addr + 1)); break;
                default: addr = s_.hl(); s_.set_hl(static_cast<uint16_t>(addr - 1)); break;
            }
            if (!q) {
                write(addr, s_.a);
            } else {
                s_.a = read(addr);
            }
            break;
        }

        case 3:
            idle();
            set_rp(p, static_cast<uint16_t>(get_rp(p) + (q ? -1 : 1)));
            break;

        case 4:
            set_r8(y, inc8(get_r8(y)));
            break;

        case 5:
            set_r8(y, dec8(get_r8(y)));
            break;

        case 6:
            set_r8(y, fetch());
            break;

        default:
            switch (y) {
            case 0: case 1: case 2: case 3:   // RLCA RRCA RLA RRA
                s_.a = rotate_shift(y, s_.a);
                s_.f &= static_cast<uint8_t>(~Flags::Z);
                break;
            case 4:
                daa();
                break;
            case 5:   // CPL
                s_.a = static_cast<uint8_t>(~s_.a);
                set_flags(zero(), true, true, carry());
                break;
            case 6:   // SCF
                set_flags(zero(), false, false, true);
                break;
            default:  // CCF
                set_flags(zero(), false, false, !carry());
                break;
            }
            break;
        }
    }

    void execute_block3(uint8_t op, uint8_t y, uint8_t z) {
        const uint8_t p = y >> 1;
        const bool q = (y & 1) != 0;

        switch (z) {
        case 0:
            switch (y) {
            case 0: case 1: case 2: case 3:   // RET cc
                idle();
                if (condition(y)) {
                    ret();
                }
                break;
            case 4:   // LDH (n),A
                write(static_cast<uint16_t>(0xFF00 | fetch()), s_.a);
                break;
            case 5: { // ADD SP,e
                const uint8_t offset = fetch();
                s_.sp = add_sp_offset(offset);
                idle();
                idle();
                break;
            }
            case 6:   // LDH A,(n)
                s_.a = read(static_cast<uint16_t>(0xFF00 | fetch()));
                break;
            default: { // LD HL,SP+e
                const uint8_t offset = fetch();
                s_.set_hl(add_sp_offset(offset));
                idle();
                break;
            }
            }
            break;

        case 1:
            if (!q) {
                set_rp2(p, pop16());
            } else {
                switch (p) {
                case 0:   // RET
                    ret();
                    break;
                case 1:   // RETI
                    ret();
                    s_.ime = true;
                    break;
                case 2:   // JP HL
                    s_.pc = s_.hl();
                    break;
                default:  // LD SP,HL
                    idle();
                    s_.sp = s_.hl();
                    break;
                }
            }
            break;

        case 2:
            switch (y) {
            case 0: case 1: case 2: case 3:
                jump_absolute(condition(y));
                break;
            case 4:   // LD (C),A
                write(static_cast<uint16_t>(0xFF00 | s_.c), s_.a);
                break;
            case 5:   // LD (nn),A
                write(fetch16(), s_.a);
                break;
            case 6:   // LD A,(C)
                s_.a = read(static_cast<uint16_t>(0xFF00 | s_.c));
                break;
            default:  // LD A,(nn)
                s_.a = read(fetch16());
                break;
            }
            break;

        case 3:
            switch (y) {
            case 0:
                jump_absolute(true);
                break;
            case 1:
                execute_cb();
                break;
            case 6:   // DI
                s_.ime = false;
                s_.ime_pending = false;
                break;
            case 7:   // EI
                s_.ime_pending = true;
                break;
            default:  // D3 DB E3 EB
                lock_up(op);
                break;
            }
            break;

        case 4:
            if (y < 4) {
                call(condition(y));
            } else {
                lock_up(op);   // E4 EC F4 FC
            }
            break;

        case 5:
            if (!q) {
                idle();
                push16(get_rp2(p));
            } else if (p == 0) {
                call(true);
            } else {
                lock_up(op);   // DD ED FD
            }
            break;

        case 6:
            alu(y, fetch());
            break;

        default:
            rst(static_cast<uint16_t>(y * 8));
            break;
        }
    }

    void execute_cb() {
        const uint8_t op = fetch();
        const uint8_t x = op >> 6;
        const uint8_t y = (op >> 3) & 0x07;
        const uint8_t z = op & 0x07;

        switch (x) {
        case 0:
            set_r8(z, rotate_shift(y, get_r8(z)));
            break;
        case 1: { // BIT y,r
            const uint8_t value = get_r8(z);
            set_flags(((value >> y) & 1) == 0, false, true, carry());
            break;
        }
        case 2:   // RES y,r
            set_r8(z, static_cast<uint8_t>(get_r8(z) & ~(1u << y)));
            break;
        default:  // SET y,r
            set_r8(z, static_cast<uint8_t>(get_r8(z) | (1u << y)));
            break;
        }
    }
};

} // namespace gbium

#endif // GBIUM_SM83_HPP

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

#include "gbium/service/DebuggerService.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace gbium::service {

namespace {

constexpr const char* kRunningError = "machine is running";

std::string format_address(uint16_t address) {
    std::ostringstream oss;
    oss << "$" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << address;
    return oss.str();
}

std::string illegal_opcode_reason(const IllegalOpcode& illegal) {
    std::ostringstream oss;
    oss << "illegal opcode $" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(illegal.opcode) << " at " << format_address(illegal.address);
    return oss.str();
}

// Bytes from [address, address + length), clipped at the top of the address space
template<typename Accessor>
std::string memory_block(uint32_t address, uint32_t length, Accessor&& accessor) {
    std::string data;
    if (address > 0xFFFF) {
        return data;
    }
    const uint32_t count = std::min<uint32_t>(length, 0x10000 - address);
    data.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        data.push_back(static_cast<char>(accessor(static_cast<uint16_t>(address + i))));
    }
    return data;
}

template<typename Response>
bool reject_unless_stopped(const DebugSession& session, Response* response) {
    if (session.stopped()) {
        return false;
    }
    response->set_success(false);
    response->set_error(kRunningError);
    return true;
}

grpc::Status running_status() {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, kRunningError);
}

} // anonymous namespace

//////////////////////////////////////////////////////////////////////////////
// DebugSession
//////////////////////////////////////////////////////////////////////////////

DebugSession::DebugSession(Dmg& machine)
    : machine_(machine) {
    machine_.set_instruction_callback(
        [this](uint16_t pc, uint64_t /*cycle*/) { return on_instruction(pc); });
}

DebugSession::~DebugSession() {
    machine_.set_instruction_callback(nullptr);
}

bool DebugSession::on_instruction(uint16_t pc) {
    if (!has_breakpoints_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (resume_pc_) {
        const bool leaving = (*resume_pc_ == pc);
        resume_pc_.reset();
        if (leaving) {
            return true;
        }
    }
    const bool hit = std::any_of(breakpoints_.begin(), breakpoints_.end(),
        [pc](const BreakpointEntry& bp) { return bp.address == pc; });
    if (!hit) {
        return true;
    }
    halt_reason_ = "breakpoint at " + format_address(pc);
    machine_.pause();
    return false;
}

void DebugSession::stop(std::string reason) {
    machine_.pause_and_wait();
    std::lock_guard<std::mutex> lock(state_mutex_);
    // Keep the breakpoint that got there first
    if (halt_reason_.empty()) {
        halt_reason_ = std::move(reason);
    }
}

void DebugSession::run() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const uint16_t pc = machine_.pc();
        const bool at_breakpoint = std::any_of(breakpoints_.begin(), breakpoints_.end(),
            [pc](const BreakpointEntry& bp) { return bp.address == pc; });
        resume_pc_ = at_breakpoint ? std::optional<uint16_t>(pc) : std::nullopt;
        halt_reason_.clear();
    }
    machine_.resume();
}

std::string DebugSession::halt_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return halt_reason_;
}

void DebugSession::clear_halt_reason() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    halt_reason_.clear();
}

std::optional<uint32_t> DebugSession::add_breakpoint(uint32_t address) {
    if (address > 0xFFFF) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    const uint32_t id = next_breakpoint_id_++;
    breakpoints_.push_back({id, static_cast<uint16_t>(address)});
    has_breakpoints_.store(true);
    return id;
}

bool DebugSession::remove_breakpoint(uint32_t id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(),
        [id](const BreakpointEntry& bp) { return bp.id == id; });
    if (it == breakpoints_.end()) {
        return false;
    }
    breakpoints_.erase(it);
    has_breakpoints_.store(!breakpoints_.empty());
    return true;
}

uint32_t DebugSession::clear_breakpoints() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto count = static_cast<uint32_t>(breakpoints_.size());
    breakpoints_.clear();
    has_breakpoints_.store(false);
    resume_pc_.reset();
    return count;
}

std::vector<BreakpointEntry> DebugSession::breakpoints() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return breakpoints_;
}

void DebugSession::fill_execution_state(ExecutionState* state) const {
    const bool stopped = machine_.is_stopped();
    state->set_is_running(!machine_.is_paused());
    state->set_sequence(machine_.sequence());

    std::string reason = halt_reason();
    if (!stopped) {
        state->set_halt_reason(reason);
        return;
    }

    const CpuState& cpu = machine_.cpu();
    if (reason.empty() && cpu.illegal) {
        reason = illegal_opcode_reason(*cpu.illegal);
    }
    state->set_halt_reason(reason);
    state->set_cycle_count(machine_.cycle_count());
    state->set_cpu_mode(cpu_mode_name(cpu.mode));
    fill_hardware_state(state->mutable_hardware());
}

void DebugSession::fill_hardware_state(HardwareStateDmg* hardware) const {
    const DmgHardware& hw = machine_.hardware();

    hardware->set_lcd_enabled(hw.ppu.lcd_enabled());
    hardware->set_ppu_mode(ppu_mode_name(hw.ppu.mode()));
    hardware->set_ly(hw.ppu.ly());

    hardware->set_interrupt_enable(hw.irq.enable_mask());
    hardware->set_interrupt_request(hw.irq.request_mask());

    hardware->set_controller(controller_name(hw.cartridge.controller()));
    hardware->set_rom_bank(hw.cartridge.rom_bank());
    if (auto bank = hw.cartridge.ram_bank()) {
        hardware->set_ram_bank(*bank);
    }

    hardware->set_dma_active(hw.dma.active());
    hardware->set_boot_rom_mapped(hw.boot_rom_mapped);
}

//////////////////////////////////////////////////////////////////////////////
// DebuggerControl
//////////////////////////////////////////////////////////////////////////////

DebuggerControlServiceImpl::DebuggerControlServiceImpl(DebugSession& session)
    : session_(session) {
}

grpc::Status DebuggerControlServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ExecutionState* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    session_.fill_execution_state(response);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Run(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    RunResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());

    if (!session_.machine().is_paused()) {
        response->set_success(false);
        response->set_error("already running");
        return grpc::Status::OK;
    }

    session_.run();
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Stop(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    StopResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());

    session_.stop("stopped by debugger");
    response->set_success(true);
    session_.fill_execution_state(response->mutable_state());
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::Reset(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ResetResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    session_.machine().reset();
    session_.clear_halt_reason();
    response->set_success(true);
    return grpc::Status::OK;
}

template<typename StepFn>
void DebuggerControlServiceImpl::step(uint32_t count, StepFn&& step_once,
                                      bool count_instructions, StepResponse* response) {
    Dmg& machine = session_.machine();
    const uint32_t steps = std::max<uint32_t>(count, 1);
    const uint64_t start_cycle = machine.cycle_count();

    for (uint32_t i = 0; i < steps; ++i) {
        step_once(machine);
    }

    session_.clear_halt_reason();
    response->set_success(true);
    response->set_instructions_executed(count_instructions ? steps : 0);
    response->set_cycles_executed(machine.cycle_count() - start_cycle);
    session_.fill_execution_state(response->mutable_state());
}

grpc::Status DebuggerControlServiceImpl::StepInstruction(
    grpc::ServerContext* /*context*/,
    const StepRequest* request,
    StepResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    // A locked CPU still advances one idle cycle per step
    step(request->count(), [](Dmg& machine) { machine.step_instruction(); }, true, response);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::StepFrame(
    grpc::ServerContext* /*context*/,
    const StepRequest* request,
    StepResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    // With the LCD off each step_frame() still returns after one frame's cycles
    step(request->count(), [](Dmg& machine) { machine.step_frame(); }, false, response);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::ReadMemory(
    grpc::ServerContext* /*context*/,
    const ReadMemoryRequest* request,
    ReadMemoryResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    const Dmg& machine = session_.machine();
    response->set_data(memory_block(request->address(), request->length(),
        [&machine](uint16_t addr) { return machine.read(addr); }));
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::WriteMemory(
    grpc::ServerContext* /*context*/,
    const WriteMemoryRequest* request,
    WriteMemoryResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    Dmg& machine = session_.machine();
    const uint32_t address = request->address();
    const std::string& data = request->data();
    for (size_t i = 0; i < data.size() && address + i <= 0xFFFF; ++i) {
        machine.write(static_cast<uint16_t>(address + i), static_cast<uint8_t>(data[i]));
    }

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::PeekMemory(
    grpc::ServerContext* /*context*/,
    const PeekMemoryRequest* request,
    PeekMemoryResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    const Dmg& machine = session_.machine();
    response->set_data(memory_block(request->address(), request->length(),
        [&machine](uint16_t addr) { return machine.peek(addr); }));
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::AddBreakpoint(
    grpc::ServerContext* /*context*/,
    const AddBreakpointRequest* request,
    AddBreakpointResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());

    auto id = session_.add_breakpoint(request->address());
    if (!id) {
        response->set_success(false);
        response->set_error("address out of range");
        return grpc::Status::OK;
    }

    response->set_success(true);
    response->set_id(*id);
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::RemoveBreakpoint(
    grpc::ServerContext* /*context*/,
    const RemoveBreakpointRequest* request,
    RemoveBreakpointResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    response->set_success(session_.remove_breakpoint(request->id()));
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::ListBreakpoints(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ListBreakpointsResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    for (const auto& bp : session_.breakpoints()) {
        auto* entry = response->add_breakpoints();
        entry->set_id(bp.id);
        entry->set_address(bp.address);
    }
    return grpc::Status::OK;
}

grpc::Status DebuggerControlServiceImpl::ClearBreakpoints(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    ClearBreakpointsResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    response->set_count_removed(session_.clear_breakpoints());
    return grpc::Status::OK;
}

//////////////////////////////////////////////////////////////////////////////
// DebuggerSm83
//////////////////////////////////////////////////////////////////////////////

DebuggerSm83ServiceImpl::DebuggerSm83ServiceImpl(DebugSession& session)
    : session_(session) {
}

grpc::Status DebuggerSm83ServiceImpl::ReadRegisters(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    RegistersSm83* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (!session_.stopped()) {
        return running_status();
    }

    const CpuState& cpu = session_.machine().cpu();
    response->set_a(cpu.a);
    response->set_f(cpu.f);
    response->set_b(cpu.b);
    response->set_c(cpu.c);
    response->set_d(cpu.d);
    response->set_e(cpu.e);
    response->set_h(cpu.h);
    response->set_l(cpu.l);
    response->set_sp(cpu.sp);
    response->set_pc(cpu.pc);
    response->set_ime(cpu.ime);

    response->set_af(cpu.af());
    response->set_bc(cpu.bc());
    response->set_de(cpu.de());
    response->set_hl(cpu.hl());

    const Flags flags = cpu.flags();
    response->set_flag_z(flags.zero);
    response->set_flag_n(flags.subtract);
    response->set_flag_h(flags.half_carry);
    response->set_flag_c(flags.carry);

    response->set_ime_pending(cpu.ime_pending);
    response->set_halt_bug(cpu.halt_bug);
    response->set_mode(cpu_mode_name(cpu.mode));
    return grpc::Status::OK;
}

grpc::Status DebuggerSm83ServiceImpl::WriteRegisters(
    grpc::ServerContext* /*context*/,
    const WriteRegistersSm83Request* request,
    WriteRegistersResponse* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (reject_unless_stopped(session_, response)) {
        return grpc::Status::OK;
    }

    Dmg& machine = session_.machine();
    auto byte = [](uint32_t value) { return static_cast<uint8_t>(value); };

    if (request->has_a()) machine.set_a(byte(request->a()));
    if (request->has_f()) machine.set_f(byte(request->f()));
    if (request->has_b()) machine.set_b(byte(request->b()));
    if (request->has_c()) machine.set_c(byte(request->c()));
    if (request->has_d()) machine.set_d(byte(request->d()));
    if (request->has_e()) machine.set_e(byte(request->e()));
    if (request->has_h()) machine.set_h(byte(request->h()));
    if (request->has_l()) machine.set_l(byte(request->l()));
    if (request->has_sp()) machine.set_sp(static_cast<uint16_t>(request->sp()));
    if (request->has_pc()) machine.set_pc(static_cast<uint16_t>(request->pc()));
    if (request->has_ime()) machine.set_ime(request->ime());

    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status DebuggerSm83ServiceImpl::ReadHardware(
    grpc::ServerContext* /*context*/,
    const Empty* /*request*/,
    HardwareStateDmg* response) {

    std::lock_guard<std::mutex> lock(session_.request_mutex());
    if (!session_.stopped()) {
        return running_status();
    }

    session_.fill_hardware_state(response);
    return grpc::Status::OK;
}

} // namespace gbium::service

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

#ifndef GBIUM_SERVICE_DEBUGGER_SERVICE_HPP
#define GBIUM_SERVICE_DEBUGGER_SERVICE_HPP

#include "debugger.grpc.pb.h"
#include "gbium/Machines.hpp"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gbium::service {

struct BreakpointEntry {
    uint32_t id;
    uint16_t address;
};

// Debugger state shared by DebuggerControl and DebuggerSm83.
//
// request_mutex() serialises debugger requests. Machine state is only touched
// while the machine is stopped (paused with no frame executing); the one
// exception is on_instruction(), which the emulation thread calls before
// each instruction of run_frame() and which sees only the breakpoint list.
//
// The instruction hook is installed by the constructor and removed by the
// destructor, so a session must be created and destroyed while no emulation
// thread is running frames.
class DebugSession {
public:
    explicit DebugSession(Dmg& machine);
    ~DebugSession();

    DebugSession(const DebugSession&) = delete;
    DebugSession& operator=(const DebugSession&) = delete;

    Dmg& machine() { return machine_; }
    std::mutex& request_mutex() { return request_mutex_; }

    bool stopped() const { return machine_.is_stopped(); }

    // Pause and wait for the emulation thread to reach an instruction boundary
    void stop(std::string reason);

    // Resume; a breakpoint at the current PC is stepped over once
    void run();

    std::string halt_reason() const;
    void clear_halt_reason();

    std::optional<uint32_t> add_breakpoint(uint32_t address);
    bool remove_breakpoint(uint32_t id);
    uint32_t clear_breakpoints();
    std::vector<BreakpointEntry> breakpoints() const;

    // Filled fully while stopped; otherwise only is_running, sequence and halt_reason
    void fill_execution_state(ExecutionState* state) const;
    void fill_hardware_state(HardwareStateDmg* hardware) const;

private:
    bool on_instruction(uint16_t pc);

    Dmg& machine_;
    std::mutex request_mutex_;

    // Guards everything below; shared with the emulation thread
    mutable std::mutex state_mutex_;
    std::vector<BreakpointEntry> breakpoints_;
    std::atomic<bool> has_breakpoints_{false};
    uint32_t next_breakpoint_id_ = 1;
    std::optional<uint16_t> resume_pc_;
    std::string halt_reason_;
};

class DebuggerControlServiceImpl final : public DebuggerControl::Service {
public:
    explicit DebuggerControlServiceImpl(DebugSession& session);

    grpc::Status GetState(grpc::ServerContext* context, const Empty* request,
                          ExecutionState* response) override;
    grpc::Status Run(grpc::ServerContext* context, const Empty* request,
                     RunResponse* response) override;
    grpc::Status Stop(grpc::ServerContext* context, const Empty* request,
                      StopResponse* response) override;
    grpc::Status Reset(grpc::ServerContext* context, const Empty* request,
                       ResetResponse* response) override;
    grpc::Status StepInstruction(grpc::ServerContext* context, const StepRequest* request,
                                 StepResponse* response) override;
    grpc::Status StepFrame(grpc::ServerContext* context, const StepRequest* request,
                           StepResponse* response) override;

    grpc::Status ReadMemory(grpc::ServerContext* context, const ReadMemoryRequest* request,
                            ReadMemoryResponse* response) override;
    grpc::Status WriteMemory(grpc::ServerContext* context, const WriteMemoryRequest* request,
                             WriteMemoryResponse* response) override;
    grpc::Status PeekMemory(grpc::ServerContext* context, const PeekMemoryRequest* request,
                            PeekMemoryResponse* response) override;

    grpc::Status AddBreakpoint(grpc::ServerContext* context, const AddBreakpointRequest* request,
                               AddBreakpointResponse* response) override;
    grpc::Status RemoveBreakpoint(grpc::ServerContext* context,
                                  const RemoveBreakpointRequest* request,
                                  RemoveBreakpointResponse* response) override;
    grpc::Status ListBreakpoints(grpc::ServerContext* context, const Empty* request,
                                 ListBreakpointsResponse* response) override;
    grpc::Status ClearBreakpoints(grpc::ServerContext* context, const Empty* request,
                                  ClearBreakpointsResponse* response) override;

private:
    template<typename StepFn>
    void step(uint32_t count, StepFn&& step_once, bool count_instructions, StepResponse* response);

    DebugSession& session_;
};

class DebuggerSm83ServiceImpl final : public DebuggerSm83::Service {
public:
    explicit DebuggerSm83ServiceImpl(DebugSession& session);

    grpc::Status ReadRegisters(grpc::ServerContext* context, const Empty* request,
                               RegistersSm83* response) override;
    grpc::Status WriteRegisters(grpc::ServerContext* context,
                                const WriteRegistersSm83Request* request,
                                WriteRegistersResponse* response) override;
    grpc::Status ReadHardware(grpc::ServerContext* context, const Empty* request,
                              HardwareStateDmg* response) override;

private:
    DebugSession& session_;
};

} // namespace gbium::service

#endif // GBIUM_SERVICE_DEBUGGER_SERVICE_HPP

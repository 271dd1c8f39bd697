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

#include "gbium/service/Server.hpp"
#include "gbium/service/CartridgeService.hpp"
#include "gbium/service/DebuggerService.hpp"
#include "gbium/service/JoypadService.hpp"
#include "gbium/service/VideoService.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace gbium::service {

struct Server::Impl {
    Dmg& machine;
    std::string address;
    uint16_t port;

    std::unique_ptr<VideoServiceImpl> video_service;
    std::unique_ptr<JoypadServiceImpl> joypad_service;
    std::unique_ptr<CartridgeServiceImpl> cartridge_service;
    std::unique_ptr<DebugSession> debug_session;
    std::unique_ptr<DebuggerControlServiceImpl> debugger_control_service;
    std::unique_ptr<DebuggerSm83ServiceImpl> debugger_sm83_service;
    std::unique_ptr<grpc::Server> grpc_server;

    std::atomic<bool> running{false};

    Impl(Dmg& m, const std::string& addr, uint16_t p)
        : machine(m), address(addr), port(p) {}

    void release_services() {
        video_service.reset();
        joypad_service.reset();
        cartridge_service.reset();
        debugger_control_service.reset();
        debugger_sm83_service.reset();
        debug_session.reset();
    }
};

Server::Server(Dmg& machine, const std::string& address, uint16_t port)
    : impl_(std::make_unique<Impl>(machine, address, port)) {
}

Server::~Server() {
    stop();
}

void Server::start() {
    if (impl_->running) {
        return;
    }

    // Create services
    impl_->video_service = std::make_unique<VideoServiceImpl>(impl_->machine.frame_buffer());
    impl_->joypad_service = std::make_unique<JoypadServiceImpl>(impl_->machine);
    impl_->cartridge_service = std::make_unique<CartridgeServiceImpl>(impl_->machine);
    impl_->debug_session = std::make_unique<DebugSession>(impl_->machine);
    impl_->debugger_control_service =
        std::make_unique<DebuggerControlServiceImpl>(*impl_->debug_session);
    impl_->debugger_sm83_service =
        std::make_unique<DebuggerSm83ServiceImpl>(*impl_->debug_session);

    // Build server address
    std::ostringstream addr_stream;
    addr_stream << impl_->address << ":" << impl_->port;
    std::string server_address = addr_stream.str();

    // Create and start gRPC server
    int selected_port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(impl_->video_service.get());
    builder.RegisterService(impl_->joypad_service.get());
    builder.RegisterService(impl_->cartridge_service.get());
    builder.RegisterService(impl_->debugger_control_service.get());
    builder.RegisterService(impl_->debugger_sm83_service.get());

    impl_->grpc_server = builder.BuildAndStart();
    if (!impl_->grpc_server || selected_port == 0) {
        impl_->grpc_server.reset();
        impl_->release_services();
        throw std::runtime_error("Cannot listen on " + server_address);
    }

    impl_->port = static_cast<uint16_t>(selected_port);
    impl_->running = true;
}

void Server::stop() {
    if (!impl_->running) {
        return;
    }

    impl_->running = false;

    if (impl_->grpc_server) {
        // Streaming handlers poll for cancellation; give them a deadline
        impl_->grpc_server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
        impl_->grpc_server.reset();
    }

    impl_->release_services();
}

bool Server::is_running() const {
    return impl_->running;
}

std::string Server::address() const {
    return impl_->address;
}

uint16_t Server::port() const {
    return impl_->port;
}

} // namespace gbium::service

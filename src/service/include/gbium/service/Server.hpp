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

#ifndef GBIUM_SERVICE_SERVER_HPP
#define GBIUM_SERVICE_SERVER_HPP

#include "gbium/Machines.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace gbium::service {

/// gRPC server hosting the Gbium services:
/// VideoService, JoypadService, CartridgeService, DebuggerControl and DebuggerSm83
class Server {
public:
    /// Create server bound to the given address and port.
    /// Port 0 asks the OS for a free port; port() reports it after start().
    explicit Server(Dmg& machine, const std::string& address = "127.0.0.1",
                    uint16_t port = 50051);
    ~Server();

    // Non-copyable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Start the server (non-blocking).
    /// Throws std::runtime_error if the address cannot be bound.
    /// start() and stop() install and remove the debugger's instruction hook,
    /// so call them while no thread is running frames.
    void start();

    /// Stop the server and wait for shutdown
    void stop();

    /// Check if server is running
    bool is_running() const;

    /// Get the address the server is bound to
    std::string address() const;

    /// Get the port the server is bound to
    uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gbium::service

#endif // GBIUM_SERVICE_SERVER_HPP

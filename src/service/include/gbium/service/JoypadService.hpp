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

#ifndef GBIUM_SERVICE_JOYPAD_SERVICE_HPP
#define GBIUM_SERVICE_JOYPAD_SERVICE_HPP

#include "joypad.grpc.pb.h"
#include "gbium/Machines.hpp"
#include <grpcpp/grpcpp.h>
#include <mutex>
#include <string>

namespace gbium::service {

class JoypadServiceImpl final : public JoypadService::Service {
public:
    explicit JoypadServiceImpl(Dmg& machine);
    ~JoypadServiceImpl() override;

    // Non-copyable
    JoypadServiceImpl(const JoypadServiceImpl&) = delete;
    JoypadServiceImpl& operator=(const JoypadServiceImpl&) = delete;

    grpc::Status ButtonDown(
        grpc::ServerContext* context,
        const ButtonRequest* request,
        ButtonResponse* response) override;

    grpc::Status ButtonUp(
        grpc::ServerContext* context,
        const ButtonRequest* request,
        ButtonResponse* response) override;

    grpc::Status GetState(
        grpc::ServerContext* context,
        const GetJoypadStateRequest* request,
        JoypadState* response) override;

private:
    bool set_button(const std::string& name, bool pressed);

    Dmg& machine_;
    std::mutex mutex_;
};

} // namespace gbium::service

#endif // GBIUM_SERVICE_JOYPAD_SERVICE_HPP

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

#include "gbium/service/JoypadService.hpp"
#include "gbium/Joypad.hpp"

namespace gbium::service {

JoypadServiceImpl::JoypadServiceImpl(Dmg& machine)
    : machine_(machine) {
}

JoypadServiceImpl::~JoypadServiceImpl() = default;

bool JoypadServiceImpl::set_button(const std::string& name, bool pressed) {
    auto button = button_from_name(name);
    if (!button) {
        return false;
    }
    machine_.set_button(*button, pressed);
    return true;
}

grpc::Status JoypadServiceImpl::ButtonDown(
    grpc::ServerContext* /*context*/,
    const ButtonRequest* request,
    ButtonResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    response->set_accepted(set_button(request->button(), true));
    return grpc::Status::OK;
}

grpc::Status JoypadServiceImpl::ButtonUp(
    grpc::ServerContext* /*context*/,
    const ButtonRequest* request,
    ButtonResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    response->set_accepted(set_button(request->button(), false));
    return grpc::Status::OK;
}

grpc::Status JoypadServiceImpl::GetState(
    grpc::ServerContext* /*context*/,
    const GetJoypadStateRequest* /*request*/,
    JoypadState* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    uint8_t mask = machine_.buttons();
    response->set_pressed_mask(mask);
    for (size_t i = 0; i < kButtonCount; ++i) {
        if (mask & (1u << i)) {
            response->add_pressed(button_name(static_cast<Button>(i)));
        }
    }

    return grpc::Status::OK;
}

} // namespace gbium::service

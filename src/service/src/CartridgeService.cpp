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

#include "gbium/service/CartridgeService.hpp"
#include "gbium/Cartridge.hpp"

#include <span>

namespace gbium::service {

namespace {

template<typename Response>
bool reject_unless_stopped(const Dmg& machine, Response* response) {
    if (machine.is_stopped()) {
        return false;
    }
    response->set_success(false);
    response->set_error("machine is running");
    return true;
}

} // anonymous namespace

CartridgeServiceImpl::CartridgeServiceImpl(Dmg& machine)
    : machine_(machine) {
}

CartridgeServiceImpl::~CartridgeServiceImpl() = default;

grpc::Status CartridgeServiceImpl::GetInfo(
    grpc::ServerContext* /*context*/,
    const GetCartridgeInfoRequest* /*request*/,
    CartridgeInfo* response) {

    std::lock_guard<std::mutex> lock(mutex_);

    const Cartridge& cartridge = machine_.hardware().cartridge;
    response->set_inserted(cartridge.inserted());
    if (!cartridge.inserted()) {
        return grpc::Status::OK;
    }

    const CartridgeHeader& header = cartridge.header();
    response->set_title(header.title);
    response->set_cartridge_type(header.cartridge_type);
    response->set_controller(controller_name(cartridge.controller()));
    response->set_rom_size(static_cast<uint32_t>(cartridge.rom().size()));
    response->set_ram_size(static_cast<uint32_t>(cartridge.layout().ram_size));
    response->set_has_battery(header.has_battery);
    response->set_header_checksum_ok(header.header_checksum_ok);
    response->set_global_checksum_ok(header.global_checksum_ok);

    return grpc::Status::OK;
}

grpc::Status CartridgeServiceImpl::ReadSaveRam(
    grpc::ServerContext* /*context*/,
    const ReadSaveRamRequest* /*request*/,
    ReadSaveRamResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    if (reject_unless_stopped(machine_, response)) {
        return grpc::Status::OK;
    }

    auto ram = machine_.save_ram();
    response->set_data(ram.data(), ram.size());
    response->set_success(true);
    return grpc::Status::OK;
}

grpc::Status CartridgeServiceImpl::WriteSaveRam(
    grpc::ServerContext* /*context*/,
    const WriteSaveRamRequest* request,
    WriteSaveRamResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    if (reject_unless_stopped(machine_, response)) {
        return grpc::Status::OK;
    }

    const std::string& data = request->data();
    machine_.load_ram(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));

    response->set_success(true);
    return grpc::Status::OK;
}

} // namespace gbium::service

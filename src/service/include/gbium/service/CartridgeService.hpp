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

#ifndef GBIUM_SERVICE_CARTRIDGE_SERVICE_HPP
#define GBIUM_SERVICE_CARTRIDGE_SERVICE_HPP

#include "cartridge.grpc.pb.h"
#include "gbium/Machines.hpp"
#include <grpcpp/grpcpp.h>
#include <mutex>

namespace gbium::service {

/// Cartridge header inspection and battery RAM transfer.
/// Save RAM is read and replaced only while the machine is stopped.
class CartridgeServiceImpl final : public CartridgeService::Service {
public:
    explicit CartridgeServiceImpl(Dmg& machine);
    ~CartridgeServiceImpl() override;

    // Non-copyable
    CartridgeServiceImpl(const CartridgeServiceImpl&) = delete;
    CartridgeServiceImpl& operator=(const CartridgeServiceImpl&) = delete;

    grpc::Status GetInfo(
        grpc::ServerContext* context,
        const GetCartridgeInfoRequest* request,
        CartridgeInfo* response) override;

    grpc::Status ReadSaveRam(
        grpc::ServerContext* context,
        const ReadSaveRamRequest* request,
        ReadSaveRamResponse* response) override;

    grpc::Status WriteSaveRam(
        grpc::ServerContext* context,
        const WriteSaveRamRequest* request,
        WriteSaveRamResponse* response) override;

private:
    Dmg& machine_;
    std::mutex mutex_;
};

} // namespace gbium::service

#endif // GBIUM_SERVICE_CARTRIDGE_SERVICE_HPP

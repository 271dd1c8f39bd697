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

// gRPC CartridgeService tests

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include "gbium/Machines.hpp"
#include "gbium/service/Server.hpp"

#include "cartridge.grpc.pb.h"
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using gbium::test::make_rom;

namespace {

class CartridgeTestFixture {
public:
    CartridgeTestFixture() {
        machine_.reset();

        server_ = std::make_unique<gbium::service::Server>(machine_, "127.0.0.1", 0);
        server_->start();

        channel_ = grpc::CreateChannel("127.0.0.1:" + std::to_string(server_->port()),
                                       grpc::InsecureChannelCredentials());
        stub_ = gbium::CartridgeService::NewStub(channel_);
    }

    ~CartridgeTestFixture() {
        server_->stop();
    }

    gbium::Dmg& machine() { return machine_; }

    gbium::CartridgeInfo get_info() {
        grpc::ClientContext context;
        gbium::GetCartridgeInfoRequest request;
        gbium::CartridgeInfo response;
        auto status = stub_->GetInfo(&context, request, &response);
        REQUIRE(status.ok());
        return response;
    }

    gbium::ReadSaveRamResponse read_save_ram() {
        grpc::ClientContext context;
        gbium::ReadSaveRamRequest request;
        gbium::ReadSaveRamResponse response;
        auto status = stub_->ReadSaveRam(&context, request, &response);
        REQUIRE(status.ok());
        return response;
    }

    gbium::WriteSaveRamResponse write_save_ram(const std::string& data) {
        grpc::ClientContext context;
        gbium::WriteSaveRamRequest request;
        gbium::WriteSaveRamResponse response;
        request.set_data(data);
        auto status = stub_->WriteSaveRam(&context, request, &response);
        REQUIRE(status.ok());
        return response;
    }

private:
    gbium::Dmg machine_;
    std::unique_ptr<gbium::service::Server> server_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<gbium::CartridgeService::Stub> stub_;
};

} // anonymous namespace

TEST_CASE("CartridgeService GetInfo with an empty slot", "[grpc][cartridge]") {
    CartridgeTestFixture fixture;

    auto info = fixture.get_info();
    CHECK_FALSE(info.inserted());
    CHECK(info.title().empty());
}

TEST_CASE("CartridgeService GetInfo describes the header", "[grpc][cartridge]") {
    CartridgeTestFixture fixture;
    // MBC1+RAM+BATTERY, 32KB ROM, 8KB RAM
    fixture.machine().load_cartridge(make_rom({0x00}, 0x03, 0x00, 0x02, "SAVEGAME"));

    auto info = fixture.get_info();
    CHECK(info.inserted());
    CHECK(info.title() == "SAVEGAME");
    CHECK(info.cartridge_type() == 0x03);
    CHECK(info.controller() == "MBC1");
    CHECK(info.rom_size() == 0x8000);
    CHECK(info.ram_size() == 0x2000);
    CHECK(info.has_battery());
    CHECK(info.header_checksum_ok());
    CHECK(info.global_checksum_ok());
}

TEST_CASE("CartridgeService ReadSaveRam returns battery RAM", "[grpc][cartridge]") {
    CartridgeTestFixture fixture;
    fixture.machine().load_cartridge(make_rom({0x00}, 0x03, 0x00, 0x02));

    // Enable RAM and store a byte through the bus
    fixture.machine().write(0x0000, 0x0A);
    fixture.machine().write(0xA010, 0x77);

    SECTION("rejected while running") {
        auto response = fixture.read_save_ram();
        CHECK_FALSE(response.success());
        CHECK(response.error() == "machine is running");
        CHECK(response.data().empty());
    }

    SECTION("returned when paused") {
        fixture.machine().pause();
        auto response = fixture.read_save_ram();
        REQUIRE(response.success());
        REQUIRE(response.data().size() == 0x2000);
        CHECK(static_cast<uint8_t>(response.data()[0x10]) == 0x77);
    }
}

TEST_CASE("CartridgeService ReadSaveRam waits for the emulation thread to stop",
          "[grpc][cartridge]") {
    CartridgeTestFixture fixture;
    auto& machine = fixture.machine();
    // LD A,$42; LD ($A000),A; JR $0100
    machine.load_cartridge(make_rom({0x3E, 0x42, 0xEA, 0x00, 0xA0, 0x18, 0xF9}, 0x03, 0x00, 0x02));
    machine.write(0x0000, 0x0A);

    const uint64_t start = machine.sequence();
    std::atomic<bool> done{false};
    std::thread emulation([&] {
        while (!done.load()) {
            machine.wait_if_paused();
            machine.run_frame();
        }
    });

    auto running = fixture.read_save_ram();
    CHECK_FALSE(running.success());

    // Each instruction bumps the sequence counter
    while (machine.sequence() < start + 100) {
        std::this_thread::yield();
    }

    machine.pause_and_wait();
    CHECK(machine.is_stopped());
    auto stopped = fixture.read_save_ram();
    CHECK(stopped.success());
    REQUIRE(stopped.data().size() == 0x2000);
    CHECK(static_cast<uint8_t>(stopped.data()[0]) == 0x42);

    done.store(true);
    machine.resume();
    emulation.join();
}

TEST_CASE("CartridgeService WriteSaveRam requires a stopped machine", "[grpc][cartridge]") {
    CartridgeTestFixture fixture;
    fixture.machine().load_cartridge(make_rom({0x00}, 0x03, 0x00, 0x02));

    std::string image(0x2000, '\x5A');

    SECTION("rejected while running") {
        auto response = fixture.write_save_ram(image);
        CHECK_FALSE(response.success());
        CHECK(response.error() == "machine is running");
    }

    SECTION("accepted when paused") {
        fixture.machine().pause();
        auto response = fixture.write_save_ram(image);
        CHECK(response.success());

        auto data = fixture.read_save_ram().data();
        REQUIRE(data.size() == 0x2000);
        CHECK(static_cast<uint8_t>(data[0]) == 0x5A);
        CHECK(static_cast<uint8_t>(data[0x1FFF]) == 0x5A);
    }
}

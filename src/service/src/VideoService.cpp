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

#include "gbium/service/VideoService.hpp"
#include "gbium/ClockTypes.hpp"
#include "gbium/FrameBuffer.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace gbium::service {

VideoServiceImpl::VideoServiceImpl(FrameBuffer& frame_buffer)
    : frame_buffer_(frame_buffer) {
}

VideoServiceImpl::~VideoServiceImpl() = default;

void VideoServiceImpl::fill_frame(const FrameBuffer& frame_buffer, Frame* frame) {
    // Version first: a swap between the two reads only makes the number stale
    frame->set_frame_number(frame_buffer.version());
    frame->set_width(static_cast<uint32_t>(frame_buffer.width()));
    frame->set_height(static_cast<uint32_t>(frame_buffer.height()));

    auto shades = frame_buffer.copy_frame();
    frame->set_shades(shades.data(), shades.size());

    std::string pixels;
    pixels.reserve(shades.size() * 4);
    for (uint8_t shade : shades) {
        uint32_t argb = shade_to_argb(shade);
        pixels.push_back(static_cast<char>(argb & 0xFF));
        pixels.push_back(static_cast<char>((argb >> 8) & 0xFF));
        pixels.push_back(static_cast<char>((argb >> 16) & 0xFF));
        pixels.push_back(static_cast<char>((argb >> 24) & 0xFF));
    }
    frame->set_pixels(std::move(pixels));
}

grpc::Status VideoServiceImpl::SubscribeFrames(
    grpc::ServerContext* context,
    const SubscribeFramesRequest* /*request*/,
    grpc::ServerWriter<Frame>* writer) {

    uint64_t last_version = 0;

    while (!context->IsCancelled()) {
        uint64_t current_version = frame_buffer_.version();

        if (current_version != last_version) {
            // New frame available
            Frame frame;
            fill_frame(frame_buffer_, &frame);

            if (!writer->Write(frame)) {
                // Client disconnected
                break;
            }

            last_version = current_version;
        }

        // Brief sleep to avoid busy-waiting
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    return grpc::Status::OK;
}

grpc::Status VideoServiceImpl::GetConfig(
    grpc::ServerContext* /*context*/,
    const GetConfigRequest* /*request*/,
    VideoConfig* response) {

    response->set_width(static_cast<uint32_t>(frame_buffer_.width()));
    response->set_height(static_cast<uint32_t>(frame_buffer_.height()));
    response->set_framerate_hz(timing::FRAMES_PER_SECOND);
    response->set_shade_count(static_cast<uint32_t>(kShadeArgb.size()));

    return grpc::Status::OK;
}

} // namespace gbium::service

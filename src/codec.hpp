// jerusalem_client - A reverse tunnel client
// Copyright (C) 2026  The jerusalem_client authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#ifndef JERUSALEM_CLIENT_CODEC_HPP
#define JERUSALEM_CLIENT_CODEC_HPP

#include "message.hpp"
#include <vector>

namespace jerusalem { namespace client {

// frame   := length:u32be payload[length]
// payload := tag:u8 fields
// string  := length:u16be bytes[length]
// uuid    := 16 raw bytes
const size_t FRAME_HEADER_SIZE = sizeof(uint32_t);
const uint32_t MAX_FRAME_SIZE = 64 * 1024;

// Both return a complete frame, header included.
// Throws std::length_error if a string field exceeds 65535 bytes or the
// payload exceeds MAX_FRAME_SIZE.
std::vector<char> encode(const client_message& msg);
std::vector<char> encode(const server_message& msg);

// Returns the payload length announced by a FRAME_HEADER_SIZE byte header.
expected<uint32_t> decode_frame_header(const std::vector<char>& header);

expected<client_message> decode_client_message(const std::vector<char>& payload);
expected<server_message> decode_server_message(const std::vector<char>& payload);

} }

#endif  // JERUSALEM_CLIENT_CODEC_HPP

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

#include "common.hpp"
#include "codec.hpp"
#include "err.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string.h>

namespace jerusalem { namespace client {

namespace {

class frame_writer {
public:
	frame_writer() : m_buf(FRAME_HEADER_SIZE) {
		// nop
	}

	void put_u8(uint8_t x) {
		m_buf.push_back(static_cast<char>(x));
	}

	void put_u16(uint16_t x) {
		x = htons(x);
		m_buf.insert(	m_buf.end(),
						reinterpret_cast<const char*>(&x),
						reinterpret_cast<const char*>(&x) + sizeof(x));
	}

	void put_string(const std::string& str) {
		if (str.size() > UINT16_MAX) {
			throw std::length_error("string field too long: " + std::to_string(str.size()));
		}
		put_u16(static_cast<uint16_t>(str.size()));
		m_buf.insert(m_buf.end(), str.begin(), str.end());
	}

	void put_uuid(const uuid& id) {
		m_buf.insert(m_buf.end(), id.begin(), id.end());
	}

	std::vector<char> finish() {
		auto size = m_buf.size() - FRAME_HEADER_SIZE;
		if (size > MAX_FRAME_SIZE) {
			throw std::length_error("frame payload too long: " + std::to_string(size));
		}
		uint32_t len = htonl(static_cast<uint32_t>(size));
		memcpy(m_buf.data(), &len, sizeof(len));
		return std::move(m_buf);
	}

private:
	std::vector<char> m_buf;
};

class payload_reader {
public:
	explicit payload_reader(const std::vector<char>& buf) : m_buf(buf) {
		// nop
	}

	bool get_u8(uint8_t& x) {
		if (remaining() < sizeof(x)) {
			return false;
		}
		x = static_cast<uint8_t>(m_buf[m_offset++]);
		return true;
	}

	bool get_u16(uint16_t& x) {
		if (remaining() < sizeof(x)) {
			return false;
		}
		memcpy(&x, m_buf.data() + m_offset, sizeof(x));
		x = ntohs(x);
		m_offset += sizeof(x);
		return true;
	}

	bool get_string(std::string& str) {
		uint16_t len;
		if (!get_u16(len) || remaining() < len) {
			return false;
		}
		str.assign(m_buf.data() + m_offset, len);
		m_offset += len;
		return true;
	}

	bool get_uuid(uuid& id) {
		if (remaining() < id.size()) {
			return false;
		}
		std::copy(m_buf.begin() + m_offset, m_buf.begin() + m_offset + id.size(), id.begin());
		m_offset += id.size();
		return true;
	}

	size_t remaining() const {
		return m_buf.size() - m_offset;
	}

private:
	const std::vector<char>& m_buf;
	size_t m_offset {0};
};

template <class T>
expected<T> finish_decode(const payload_reader& rd, bool ok, T msg, const char* name) {
	if (!ok) {
		return make_error(err::protocol_error, std::string("truncated ") + name + " message");
	}
	if (rd.remaining() != 0) {
		return make_error(err::protocol_error,
						  std::string("trailing bytes after ") + name + " message");
	}
	return std::move(msg);
}

}

std::vector<char> encode(const client_message& msg) {
	frame_writer wr;
	wr.put_u8(static_cast<uint8_t>(msg.type));
	switch (msg.type) {
	case client_message_type::hello:
		wr.put_u16(msg.port);
		break;
	case client_message_type::authenticate:
		wr.put_string(msg.answer);
		wr.put_string(msg.client_id);
		break;
	case client_message_type::accept:
		wr.put_uuid(msg.connection_id);
		break;
	}
	return wr.finish();
}

std::vector<char> encode(const server_message& msg) {
	frame_writer wr;
	wr.put_u8(static_cast<uint8_t>(msg.type));
	switch (msg.type) {
	case server_message_type::challenge:
		wr.put_uuid(msg.challenge);
		break;
	case server_message_type::free_port:
	case server_message_type::hello:
		wr.put_u16(msg.port);
		break;
	case server_message_type::heartbeat:
		wr.put_u8(msg.alive ? 1 : 0);
		break;
	case server_message_type::connection:
		wr.put_uuid(msg.connection_id);
		break;
	case server_message_type::error:
		wr.put_string(msg.what);
		break;
	}
	return wr.finish();
}

expected<uint32_t> decode_frame_header(const std::vector<char>& header) {
	if (header.size() != FRAME_HEADER_SIZE) {
		return make_error(err::protocol_error, "invalid frame header size");
	}

	uint32_t len;
	memcpy(&len, header.data(), sizeof(len));
	len = ntohl(len);
	if (len == 0 || len > MAX_FRAME_SIZE) {
		return make_error(err::protocol_error, "invalid frame length: " + std::to_string(len));
	}
	return len;
}

expected<client_message> decode_client_message(const std::vector<char>& payload) {
	payload_reader rd(payload);
	uint8_t tag;
	if (!rd.get_u8(tag)) {
		return make_error(err::protocol_error, "empty message");
	}

	client_message msg;
	msg.type = static_cast<client_message_type>(tag);
	switch (msg.type) {
	case client_message_type::hello: {
		auto ok = rd.get_u16(msg.port);
		return finish_decode(rd, ok, std::move(msg), "Hello");
	}
	case client_message_type::authenticate: {
		auto ok = rd.get_string(msg.answer) && rd.get_string(msg.client_id);
		return finish_decode(rd, ok, std::move(msg), "Authenticate");
	}
	case client_message_type::accept: {
		auto ok = rd.get_uuid(msg.connection_id);
		return finish_decode(rd, ok, std::move(msg), "Accept");
	}
	}
	return make_error(err::protocol_error, "unknown client message tag: " + std::to_string(tag));
}

expected<server_message> decode_server_message(const std::vector<char>& payload) {
	payload_reader rd(payload);
	uint8_t tag;
	if (!rd.get_u8(tag)) {
		return make_error(err::protocol_error, "empty message");
	}

	server_message msg;
	msg.type = static_cast<server_message_type>(tag);
	switch (msg.type) {
	case server_message_type::challenge: {
		auto ok = rd.get_uuid(msg.challenge);
		return finish_decode(rd, ok, std::move(msg), "Challenge");
	}
	case server_message_type::free_port: {
		auto ok = rd.get_u16(msg.port);
		return finish_decode(rd, ok, std::move(msg), "FreePort");
	}
	case server_message_type::hello: {
		auto ok = rd.get_u16(msg.port);
		return finish_decode(rd, ok, std::move(msg), "Hello");
	}
	case server_message_type::heartbeat: {
		uint8_t alive = 0;
		auto ok = rd.get_u8(alive);
		msg.alive = alive != 0;
		return finish_decode(rd, ok, std::move(msg), "Heartbeat");
	}
	case server_message_type::connection: {
		auto ok = rd.get_uuid(msg.connection_id);
		return finish_decode(rd, ok, std::move(msg), "Connection");
	}
	case server_message_type::error: {
		auto ok = rd.get_string(msg.what);
		return finish_decode(rd, ok, std::move(msg), "Error");
	}
	}
	return make_error(err::protocol_error, "unknown server message tag: " + std::to_string(tag));
}

} }

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

#include "message.hpp"

namespace jerusalem { namespace client {

const char* to_string(client_message_type type) {
	switch (type) {
	case client_message_type::hello:
		return "Hello";
	case client_message_type::authenticate:
		return "Authenticate";
	case client_message_type::accept:
		return "Accept";
	}
	return "Unknown";
}

const char* to_string(server_message_type type) {
	switch (type) {
	case server_message_type::challenge:
		return "Challenge";
	case server_message_type::free_port:
		return "FreePort";
	case server_message_type::hello:
		return "Hello";
	case server_message_type::heartbeat:
		return "Heartbeat";
	case server_message_type::connection:
		return "Connection";
	case server_message_type::error:
		return "Error";
	}
	return "Unknown";
}

client_message client_message::make_hello(uint16_t port) {
	client_message msg;
	msg.type = client_message_type::hello;
	msg.port = port;
	return msg;
}

client_message client_message::make_authenticate(std::string answer, std::string client_id) {
	client_message msg;
	msg.type = client_message_type::authenticate;
	msg.answer = std::move(answer);
	msg.client_id = std::move(client_id);
	return msg;
}

client_message client_message::make_accept(const uuid& connection_id) {
	client_message msg;
	msg.type = client_message_type::accept;
	msg.connection_id = connection_id;
	return msg;
}

server_message server_message::make_challenge(const uuid& challenge) {
	server_message msg;
	msg.type = server_message_type::challenge;
	msg.challenge = challenge;
	return msg;
}

server_message server_message::make_free_port(uint16_t port) {
	server_message msg;
	msg.type = server_message_type::free_port;
	msg.port = port;
	return msg;
}

server_message server_message::make_hello(uint16_t port) {
	server_message msg;
	msg.type = server_message_type::hello;
	msg.port = port;
	return msg;
}

server_message server_message::make_heartbeat(bool alive) {
	server_message msg;
	msg.type = server_message_type::heartbeat;
	msg.alive = alive;
	return msg;
}

server_message server_message::make_connection(const uuid& connection_id) {
	server_message msg;
	msg.type = server_message_type::connection;
	msg.connection_id = connection_id;
	return msg;
}

server_message server_message::make_error(std::string what) {
	server_message msg;
	msg.type = server_message_type::error;
	msg.what = std::move(what);
	return msg;
}

} }

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

#ifndef JERUSALEM_CLIENT_MESSAGE_HPP
#define JERUSALEM_CLIENT_MESSAGE_HPP

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <string>
#include <cstdint>

namespace jerusalem { namespace client {

using uuid = boost::uuids::uuid;

// Tag values are the first payload byte on the wire.
enum class client_message_type : uint8_t {
	hello = 1,
	authenticate = 2,
	accept = 3
};

enum class server_message_type : uint8_t {
	challenge = 1,
	free_port = 2,
	hello = 3,
	heartbeat = 4,
	connection = 5,
	error = 6
};

const char* to_string(client_message_type type);
const char* to_string(server_message_type type);

// Only the fields belonging to `type` are meaningful.
struct client_message {
	client_message_type type {client_message_type::hello};
	uint16_t port {0};
	std::string answer;
	std::string client_id;
	uuid connection_id = boost::uuids::nil_uuid();

	static client_message make_hello(uint16_t port);
	static client_message make_authenticate(std::string answer, std::string client_id);
	static client_message make_accept(const uuid& connection_id);
};

struct server_message {
	server_message_type type {server_message_type::heartbeat};
	uuid challenge = boost::uuids::nil_uuid();
	uint16_t port {0};
	bool alive {false};
	uuid connection_id = boost::uuids::nil_uuid();
	std::string what;

	static server_message make_challenge(const uuid& challenge);
	static server_message make_free_port(uint16_t port);
	static server_message make_hello(uint16_t port);
	static server_message make_heartbeat(bool alive);
	static server_message make_connection(const uuid& connection_id);
	static server_message make_error(std::string what);
};

} }

#endif  // JERUSALEM_CLIENT_MESSAGE_HPP

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

#ifndef JERUSALEM_CLIENT_CLIENT_SETTINGS_HPP
#define JERUSALEM_CLIENT_CLIENT_SETTINGS_HPP

#include <chrono>
#include <iosfwd>
#include <string>
#include <cstdint>

namespace jerusalem { namespace client {

const uint16_t DEFAULT_SERVER_PORT = 7835;
const char* const DEFAULT_LOCAL_HOST = "localhost";
const std::chrono::seconds DEFAULT_NETWORK_TIMEOUT(120);

struct client_settings {
	std::string server_host;
	uint16_t server_port {0};
	std::string local_host;
	uint16_t local_port {0};
	std::string client_id;
	std::string secret;
	// Bounds every connect and every handshake receive.
	std::chrono::milliseconds network_timeout {DEFAULT_NETWORK_TIMEOUT};
	std::string log;
	bool verbose {false};
};

// Overrides `settings` with the children of the <jerusalem_client> node of
// an XML file. Nodes that are absent leave the current value untouched.
error load_settings(const std::string& path, client_settings& settings);

// Settings that are still empty (or zero for ports) are taken from the
// SERVER, CLIENT_ID, SECRET_KEY, LOCAL_HOST, LOCAL_PORT and SERVER_PORT
// environment variables, or asked for on `in`. An empty answer leaves the
// local port unset and selects the default local host and server port.
error prompt_missing_settings(client_settings& settings, std::istream& in, std::ostream& out);

error validate_settings(const client_settings& settings);

} }

#endif  // JERUSALEM_CLIENT_CLIENT_SETTINGS_HPP

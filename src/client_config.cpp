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
#include "client_config.hpp"
#include "err.hpp"

namespace jerusalem { namespace client {

client_config::client_config() {
	opt_group(custom_options_, "global")
		.add(server, "server,s", "set server address")
		.add(server_port, "server_port,P", "set server port (asked for if unset, default: 7835)")
		.add(local_host, "local_host,l", "set host of the forwarded service (asked for if unset, default: localhost)")
		.add(local_port, "local_port,p", "set port of the forwarded service")
		.add(client_id, "client_id,i", "set client id")
		.add(secret_key, "secret_key,k", "set secret key")
		.add(timeout, "timeout,t", "set network timeout in seconds (default: 120)")
		.add(log, "log", "set log file path (default: empty)")
		.add(config, "config", "load a config file (it overrides the options above)")
		.add(verbose, "verbose,v", "enable verbose output (default: disable)");

	middleman_network_backend = atom("asio");
	load<middleman>();
	add_error_category(ERROR_CATEGORY, render_error);
}

client_settings client_config::settings() const {
	client_settings s;
	s.server_host = server;
	s.server_port = server_port;
	s.local_host = local_host;
	s.local_port = local_port;
	s.client_id = client_id;
	s.secret = secret_key;
	s.network_timeout = std::chrono::seconds(timeout);
	s.log = log;
	s.verbose = verbose;
	return s;
}

} }

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
#include "control_session.hpp"
#include "tunnel_connection.hpp"
#include "async_connect.hpp"
#include "logger_ostream.hpp"
#include "err.hpp"
#include <boost/uuid/uuid_io.hpp>

namespace jerusalem { namespace client {

control_state::control_state(control_session::broker_pointer self)
	: m_self(self)
	, m_channel(self) {
	// nop
}

void control_state::init(const client_settings& settings, const actor& listener) {
	m_settings = settings;
	m_listener = listener;
	m_auth = std::make_shared<const authenticator>(settings.secret);

	m_self->set_down_handler([this] (down_msg& msg) {
		handle_tunnel_down(msg);
	});
	m_self->set_exit_handler([this] (exit_msg& msg) {
		if (msg.reason) {
			terminate(std::move(msg.reason));
		}
	});

	if (m_settings.verbose) {
		log(m_self) << "INFO: Connecting to server at "
					<< m_settings.server_host << ":" << m_settings.server_port << std::endl;
	}
	async_connect(m_self, m_settings.server_host, m_settings.server_port,
				  m_settings.network_timeout);
}

void control_state::handle_new_data(const new_data_msg& msg) {
	m_channel.handle_new_data(msg);
}

void control_state::handle_conn_closed(const connection_closed_msg& msg) {
	m_channel.handle_conn_closed(msg);
}

void control_state::handle_connect_succ(connection_handle hdl) {
	m_channel.init(hdl);
	m_auth->perform_client_handshake(m_channel, m_settings.client_id, m_settings.network_timeout,
									 [this] (expected<uint16_t> port) {
		handle_handshake(std::move(port));
	});
}

void control_state::handle_connect_fail(const error& what) {
	terminate(annotate(what, "failed to connect to " + m_settings.server_host));
}

void control_state::handle_deadline(uint64_t id) {
	m_channel.handle_deadline(id);
}

void control_state::handle_handshake(expected<uint16_t> port) {
	if (!port) {
		terminate(annotate(port.error(), "client handshake failed"));
		return;
	}

	auto e = m_channel.send(client_message::make_hello(*port));
	if (e) {
		terminate(annotate(e, "failed to send hello message"));
		return;
	}

	m_channel.receive(m_settings.network_timeout, [this] (expected<server_message> msg) {
		handle_initial_message(std::move(msg));
	});
}

void control_state::handle_initial_message(expected<server_message> msg) {
	if (!msg) {
		terminate(annotate(msg.error(), "failed to receive server message"));
		return;
	}

	switch (msg->type) {
	case server_message_type::hello:
		m_remote_port = msg->port;
		break;
	case server_message_type::error:
		terminate(make_error(err::server_error, "server error: " + msg->what));
		return;
	case server_message_type::challenge:
		terminate(make_error(err::auth_error,
							 "server requires authentication, but no client secret was provided"));
		return;
	default:
		terminate(make_error(err::protocol_error,
							 std::string("unexpected initial non-hello message of type: ")
							 + to_string(msg->type)));
		return;
	}

	log(m_self) << "INFO: Connected to server at "
				<< m_settings.server_host << ":" << m_remote_port << std::endl;
	log(m_self) << "INFO: Listening for connections to redirect" << std::endl;
	if (m_listener) {
		m_self->send(m_listener, established_atom::value, m_remote_port);
	}
	listen();
}

void control_state::listen() {
	m_channel.receive([this] (expected<server_message> msg) {
		handle_server_message(std::move(msg));
	});
}

void control_state::handle_server_message(expected<server_message> msg) {
	if (!msg) {
		terminate(annotate(msg.error(), "failed to receive server message"));
		return;
	}

	switch (msg->type) {
	case server_message_type::hello:
		log(m_self) << "WARN: Received an unexpected hello message" << std::endl;
		break;
	case server_message_type::challenge:
		log(m_self) << "WARN: Received an unexpected challenge message" << std::endl;
		break;
	case server_message_type::heartbeat:
		break;
	case server_message_type::connection:
		open_tunnel(msg->connection_id);
		break;
	case server_message_type::error:
		terminate(make_error(err::server_error, "server error: " + msg->what));
		return;
	default:
		terminate(make_error(err::protocol_error,
							 std::string("received unexpected message type: ")
							 + to_string(msg->type)));
		return;
	}
	listen();
}

void control_state::open_tunnel(const uuid& connection_id) {
	auto tunnel = m_self->system().middleman().spawn_broker(tunnel_connection_impl,
															m_settings, m_auth, connection_id);
	m_self->monitor(tunnel);
	m_tunnels.emplace(tunnel.address(), connection_id);
	if (m_settings.verbose) {
		log(m_self) << "INFO: Accepting connection " << connection_id << std::endl;
	}
}

void control_state::handle_tunnel_down(const down_msg& msg) {
	auto it = m_tunnels.find(msg.source);
	if (it == m_tunnels.end()) {
		return;
	}

	if (msg.reason && msg.reason != make_error(exit_reason::user_shutdown)) {
		log(m_self) << "ERROR: Connection exited with error: "
					<< m_self->system().render(msg.reason) << std::endl;
	} else {
		log(m_self) << "INFO: Connection closed gracefully" << std::endl;
	}
	m_tunnels.erase(it);
}

void control_state::terminate(error reason) {
	for (auto& i: m_tunnels) {
		m_self->send_exit(i.first, exit_reason::user_shutdown);
	}
	m_tunnels.clear();
	m_self->quit(std::move(reason));
}

control_session::behavior_type
control_session_impl(	control_session::stateful_broker_pointer<control_state> self,
						const client_settings& settings, const actor& listener) {
	self->state.init(settings, listener);
	return {
		[self] (const new_data_msg& msg) {
			self->state.handle_new_data(msg);
		},
		[self] (const connection_closed_msg& msg) {
			self->state.handle_conn_closed(msg);
		},
		[self] (connection_handle hdl) {
			self->state.handle_connect_succ(hdl);
		},
		[self] (connect_atom, const error& what) {
			self->state.handle_connect_fail(what);
		},
		[self] (deadline_atom, uint64_t id) {
			self->state.handle_deadline(id);
		}
	};
}

} }

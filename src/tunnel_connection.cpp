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
#include "tunnel_connection.hpp"
#include "async_connect.hpp"
#include "logger_ostream.hpp"
#include "err.hpp"
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>

namespace jerusalem { namespace client {

tunnel_state::tunnel_state(tunnel_connection::broker_pointer self)
	: m_self(self)
	, m_channel(self) {
	// nop
}

void tunnel_state::init(const client_settings& settings,
						std::shared_ptr<const authenticator> auth,
						const uuid& connection_id) {
	m_settings = settings;
	m_auth = std::move(auth);
	m_connection_id = connection_id;
	async_connect(m_self, m_settings.server_host, m_settings.server_port,
				  m_settings.network_timeout);
}

void tunnel_state::handle_new_data(const new_data_msg& msg) {
	if (m_channel.handle_new_data(msg)) {
		return;
	}

	if (msg.handle == m_server_hdl) {
		if (m_phase == phase::relaying) {
			relay(m_local_hdl, msg.buf);
			m_pending_to_local += msg.buf.size();
		} else {
			m_buf.insert(m_buf.end(), msg.buf.begin(), msg.buf.end());
		}
	} else if (msg.handle == m_local_hdl) {
		relay(m_server_hdl, msg.buf);
		m_pending_to_server += msg.buf.size();
	}
}

void tunnel_state::handle_conn_closed(const connection_closed_msg& msg) {
	if (m_channel.handle_conn_closed(msg)) {
		return;
	}

	if (msg.handle == m_server_hdl) {
		m_server_closed = true;
		if (m_pending_to_server > 0) {
			fail(make_error(err::io_error, "server connection closed with "
							+ std::to_string(m_pending_to_server) + " bytes unsent"));
			return;
		}
	} else if (msg.handle == m_local_hdl) {
		m_local_closed = true;
		if (m_pending_to_local > 0) {
			fail(make_error(err::io_error, "local connection closed with "
							+ std::to_string(m_pending_to_local) + " bytes unsent"));
			return;
		}
	}
	check_finished();
}

void tunnel_state::handle_data_transferred(const data_transferred_msg& msg) {
	if (msg.handle == m_server_hdl) {
		m_pending_to_server -= std::min(m_pending_to_server, static_cast<uint64_t>(msg.written));
	} else if (msg.handle == m_local_hdl) {
		m_pending_to_local -= std::min(m_pending_to_local, static_cast<uint64_t>(msg.written));
	}
	check_finished();
}

void tunnel_state::handle_connect_succ(connection_handle hdl) {
	if (m_phase == phase::connecting_server) {
		m_server_hdl = hdl;
		m_channel.init(hdl);
		if (!m_auth) {
			accept();
			return;
		}

		m_phase = phase::handshaking;
		m_auth->perform_client_handshake(m_channel, m_settings.client_id, m_settings.network_timeout,
										 [this] (expected<uint16_t> port) {
			if (!port) {
				fail(annotate(port.error(), "client handshake failed"));
			} else {
				accept();
			}
		});
	} else if (m_phase == phase::connecting_local) {
		m_local_hdl = hdl;
		m_phase = phase::relaying;
		m_self->ack_writes(m_local_hdl, true);
		m_self->configure_read(m_local_hdl, receive_policy::at_most(BUFFER_SIZE));
		if (m_settings.verbose) {
			log(m_self) << "INFO: Relaying connection " << m_connection_id << std::endl;
		}

		if (!m_buf.empty()) {
			m_pending_to_local += m_buf.size();
			auto& wr_buf = m_self->wr_buf(m_local_hdl);
			if (wr_buf.empty()) {
				wr_buf = std::move(m_buf);
			} else {
				wr_buf.insert(wr_buf.end(), m_buf.begin(), m_buf.end());
			}
			m_buf.clear();
			m_self->flush(m_local_hdl);
		}
		check_finished();
	}
}

void tunnel_state::handle_connect_fail(const error& what) {
	if (m_phase == phase::connecting_local) {
		fail(annotate(what, "failed to connect to local host "
					  + m_settings.local_host + ":" + std::to_string(m_settings.local_port)));
	} else {
		fail(annotate(what, "failed to connect to " + m_settings.server_host));
	}
}

void tunnel_state::handle_deadline(uint64_t id) {
	m_channel.handle_deadline(id);
}

void tunnel_state::accept() {
	// The Accept frame is the first acknowledged write on the server side.
	m_self->ack_writes(m_server_hdl, true);
	auto sent = m_channel.bytes_sent();
	auto e = m_channel.send(client_message::make_accept(m_connection_id));
	if (e) {
		fail(annotate(e, "failed to send accept message"));
		return;
	}
	m_pending_to_server += m_channel.bytes_sent() - sent;

	m_channel.detach();
	m_phase = phase::connecting_local;
	async_connect(m_self, m_settings.local_host, m_settings.local_port,
				  m_settings.network_timeout);
}

void tunnel_state::relay(connection_handle hdl, const std::vector<char>& buf) {
	if (m_self->valid(hdl)) {
		m_self->write(hdl, buf.size(), buf.data());
		m_self->flush(hdl);
	}
}

void tunnel_state::fail(error reason) {
	m_self->quit(std::move(reason));
}

void tunnel_state::check_finished() {
	if (m_phase != phase::relaying) {
		return;
	}

	auto server_done = m_server_closed && (m_local_closed || m_pending_to_local == 0);
	auto local_done = m_local_closed && (m_server_closed || m_pending_to_server == 0);
	if (server_done || local_done) {
		m_self->quit();
	}
}

tunnel_connection::behavior_type
tunnel_connection_impl(	tunnel_connection::stateful_broker_pointer<tunnel_state> self,
						const client_settings& settings,
						std::shared_ptr<const authenticator> auth,
						const uuid& connection_id) {
	self->state.init(settings, std::move(auth), connection_id);
	return {
		[self] (const new_data_msg& msg) {
			self->state.handle_new_data(msg);
		},
		[self] (const connection_closed_msg& msg) {
			self->state.handle_conn_closed(msg);
		},
		[self] (const data_transferred_msg& msg) {
			self->state.handle_data_transferred(msg);
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

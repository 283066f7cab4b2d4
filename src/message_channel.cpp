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
#include "message_channel.hpp"
#include "codec.hpp"
#include "err.hpp"

namespace jerusalem { namespace client {

message_channel::message_channel(abstract_broker* self)
	: m_self(self) {
	// nop
}

void message_channel::init(connection_handle hdl) {
	m_hdl = hdl;
	m_attached = true;
	m_reading_header = true;
	m_self->configure_read(m_hdl, receive_policy::exactly(FRAME_HEADER_SIZE));
}

void message_channel::detach() {
	m_attached = false;
	m_handler = nullptr;
	m_pending_deadline = 0;
	m_self->configure_read(m_hdl, receive_policy::at_most(BUFFER_SIZE));
}

connection_handle message_channel::handle() const {
	return m_hdl;
}

bool message_channel::attached() const {
	return m_attached;
}

error message_channel::send(const client_message& msg) {
	if (m_failure) {
		return m_failure;
	}
	if (!m_attached || !m_self->valid(m_hdl)) {
		return make_error(err::connection_error, "channel is not connected");
	}

	auto buf = encode(msg);
	auto& wr_buf = m_self->wr_buf(m_hdl);
	wr_buf.insert(wr_buf.end(), buf.begin(), buf.end());
	m_self->flush(m_hdl);
	m_bytes_sent += buf.size();
	return none;
}

uint64_t message_channel::bytes_sent() const {
	return m_bytes_sent;
}

void message_channel::receive(receive_handler handler) {
	m_handler = std::move(handler);
	m_pending_deadline = 0;
	deliver();
}

void message_channel::receive(std::chrono::milliseconds timeout, receive_handler handler) {
	m_handler = std::move(handler);
	m_pending_deadline = ++m_deadline_id;
	delayed_anon_send(actor_cast<actor>(m_self), timeout, deadline_atom::value, m_pending_deadline);
	deliver();
}

bool message_channel::handle_new_data(const new_data_msg& msg) {
	if (!m_attached || msg.handle != m_hdl) {
		return false;
	}

	if (m_reading_header) {
		auto len = decode_frame_header(msg.buf);
		if (!len) {
			fail(std::move(len.error()));
			return true;
		}
		m_reading_header = false;
		m_self->configure_read(m_hdl, receive_policy::exactly(*len));
	} else {
		m_reading_header = true;
		m_self->configure_read(m_hdl, receive_policy::exactly(FRAME_HEADER_SIZE));
		m_inbox.emplace(decode_server_message(msg.buf));
		deliver();
	}
	return true;
}

bool message_channel::handle_conn_closed(const connection_closed_msg& msg) {
	if (!m_attached || msg.handle != m_hdl) {
		return false;
	}

	fail(make_error(err::connection_error, "connection closed by peer"));
	return true;
}

void message_channel::handle_deadline(uint64_t id) {
	if (!m_handler || id != m_pending_deadline) {
		return;
	}

	receive_handler handler;
	handler.swap(m_handler);
	m_pending_deadline = 0;
	handler(make_error(err::timeout, "no message received before the deadline"));
}

void message_channel::deliver() {
	if (m_delivering) {
		return;
	}

	m_delivering = true;
	while (m_handler && (!m_inbox.empty() || m_failure)) {
		receive_handler handler;
		handler.swap(m_handler);
		m_pending_deadline = 0;
		if (!m_inbox.empty()) {
			auto msg = std::move(m_inbox.front());
			m_inbox.pop();
			handler(std::move(msg));
		} else {
			handler(m_failure);
		}
	}
	m_delivering = false;
}

void message_channel::fail(error reason) {
	if (!m_failure) {
		m_failure = std::move(reason);
	}
	deliver();
}

} }

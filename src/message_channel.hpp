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

#ifndef JERUSALEM_CLIENT_MESSAGE_CHANNEL_HPP
#define JERUSALEM_CLIENT_MESSAGE_CHANNEL_HPP

#include "message.hpp"
#include <chrono>
#include <functional>
#include <queue>

namespace jerusalem { namespace client {

// Typed message transport over one connection of a broker.
//
// The owning broker forwards its new_data_msg, connection_closed_msg and
// (deadline_atom, uint64_t) messages to the handle_* members. Frames are
// read with receive_policy::exactly, so nothing past the last frame is
// consumed from the socket; after detach() the connection carries raw
// bytes again and belongs to the broker.
class message_channel {
public:
	using receive_handler = std::function<void (expected<server_message>)>;

	explicit message_channel(abstract_broker* self);

	message_channel(const message_channel&) = delete;
	message_channel& operator = (const message_channel&) = delete;

	void init(connection_handle hdl);
	void detach();

	connection_handle handle() const;
	bool attached() const;

	// Writes one complete frame.
	error send(const client_message& msg);

	// Total frame bytes handed to the broker by send().
	uint64_t bytes_sent() const;

	// Delivers the next message in arrival order. Only one receive may be
	// pending at a time.
	void receive(receive_handler handler);
	void receive(std::chrono::milliseconds timeout, receive_handler handler);

	// Each returns false if the message does not belong to this channel.
	bool handle_new_data(const new_data_msg& msg);
	bool handle_conn_closed(const connection_closed_msg& msg);
	void handle_deadline(uint64_t id);

private:
	void deliver();
	void fail(error reason);

	abstract_broker* const m_self;
	connection_handle m_hdl;
	bool m_attached {false};
	bool m_reading_header {true};
	std::queue<expected<server_message>> m_inbox;
	error m_failure;
	receive_handler m_handler;
	uint64_t m_deadline_id {0};
	uint64_t m_pending_deadline {0};
	uint64_t m_bytes_sent {0};
	bool m_delivering {false};
};

} }

#endif  // JERUSALEM_CLIENT_MESSAGE_CHANNEL_HPP

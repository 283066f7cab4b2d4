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

#ifndef JERUSALEM_CLIENT_CONTROL_SESSION_HPP
#define JERUSALEM_CLIENT_CONTROL_SESSION_HPP

#include "client_settings.hpp"
#include "authenticator.hpp"
#include "message_channel.hpp"
#include <map>
#include <memory>

namespace jerusalem { namespace client {

using control_session =
  connection_handler::extend<
    reacts_to<connection_handle>,
    reacts_to<connect_atom, error>,
    reacts_to<deadline_atom, uint64_t>
  >;

class control_state {
public:
  control_state(control_session::broker_pointer self);

  control_state(const control_state&) = delete;
  control_state& operator = (const control_state&) = delete;

  void init(const client_settings& settings, const actor& listener);

  void handle_new_data(const new_data_msg& msg);
  void handle_conn_closed(const connection_closed_msg& msg);
  void handle_connect_succ(connection_handle hdl);
  void handle_connect_fail(const error& what);
  void handle_deadline(uint64_t id);

private:
  void handle_handshake(expected<uint16_t> port);
  void handle_initial_message(expected<server_message> msg);
  void listen();
  void handle_server_message(expected<server_message> msg);
  void open_tunnel(const uuid& connection_id);
  void handle_tunnel_down(const down_msg& msg);
  void terminate(error reason);

  const control_session::broker_pointer m_self;
  client_settings m_settings;
  std::shared_ptr<const authenticator> m_auth;
  actor m_listener = unsafe_actor_handle_init;
  message_channel m_channel;
  uint16_t m_remote_port {0};
  std::map<actor_addr, uuid> m_tunnels;
};

// Connects to the relay server, authenticates and registers the local
// forward target. `(established_atom, uint16_t)` is sent to `listener`
// with the public port once the server has said Hello. The broker then
// serves Connection requests until the control connection fails, and
// quits with that failure.
control_session::behavior_type
control_session_impl(control_session::stateful_broker_pointer<control_state> self,
                     const client_settings& settings, const actor& listener);

} }

#endif  // JERUSALEM_CLIENT_CONTROL_SESSION_HPP

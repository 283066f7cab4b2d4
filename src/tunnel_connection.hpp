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

#ifndef JERUSALEM_CLIENT_TUNNEL_CONNECTION_HPP
#define JERUSALEM_CLIENT_TUNNEL_CONNECTION_HPP

#include "client_settings.hpp"
#include "authenticator.hpp"
#include "message_channel.hpp"
#include <memory>
#include <vector>

namespace jerusalem { namespace client {

using tunnel_connection =
  connection_handler::extend<
    reacts_to<data_transferred_msg>,
    reacts_to<connection_handle>,
    reacts_to<connect_atom, error>,
    reacts_to<deadline_atom, uint64_t>
  >;

class tunnel_state {
public:
  tunnel_state(tunnel_connection::broker_pointer self);

  tunnel_state(const tunnel_state&) = delete;
  tunnel_state& operator = (const tunnel_state&) = delete;

  void init(const client_settings& settings,
            std::shared_ptr<const authenticator> auth,
            const uuid& connection_id);

  void handle_new_data(const new_data_msg& msg);
  void handle_conn_closed(const connection_closed_msg& msg);
  void handle_data_transferred(const data_transferred_msg& msg);
  void handle_connect_succ(connection_handle hdl);
  void handle_connect_fail(const error& what);
  void handle_deadline(uint64_t id);

private:
  enum class phase {
    connecting_server,
    handshaking,
    connecting_local,
    relaying
  };

  void accept();
  void relay(connection_handle hdl, const std::vector<char>& buf);
  void fail(error reason);
  void check_finished();

  const tunnel_connection::broker_pointer m_self;
  client_settings m_settings;
  std::shared_ptr<const authenticator> m_auth;
  uuid m_connection_id;
  phase m_phase {phase::connecting_server};
  message_channel m_channel;
  connection_handle m_server_hdl;
  connection_handle m_local_hdl;
  bool m_server_closed {false};
  bool m_local_closed {false};
  uint64_t m_pending_to_server {0};
  uint64_t m_pending_to_local {0};
  std::vector<char> m_buf;
};

// Serves one forwarded connection: dials the server, authenticates when
// `auth` is set, accepts `connection_id`, dials the local service and
// copies bytes both ways. Quits normally once either side has closed and
// everything read from it has been written to the other side.
tunnel_connection::behavior_type
tunnel_connection_impl(tunnel_connection::stateful_broker_pointer<tunnel_state> self,
                       const client_settings& settings,
                       std::shared_ptr<const authenticator> auth,
                       const uuid& connection_id);

} }

#endif  // JERUSALEM_CLIENT_TUNNEL_CONNECTION_HPP

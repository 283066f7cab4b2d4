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

#ifndef JERUSALEM_CLIENT_CLIENT_CONFIG_HPP
#define JERUSALEM_CLIENT_CLIENT_CONFIG_HPP

#include "client_settings.hpp"
#include <string>

namespace jerusalem { namespace client {

class client_config : public actor_system_config {
public:
  std::string server;
  uint16_t server_port = 0;
  std::string local_host;
  uint16_t local_port = 0;
  std::string client_id;
  std::string secret_key;
  size_t timeout = DEFAULT_NETWORK_TIMEOUT.count();
  std::string log;
  std::string config;
  bool verbose = false;

  client_config();

  // Settings as given on the command line.
  client_settings settings() const;
};

} }

#endif  // JERUSALEM_CLIENT_CLIENT_CONFIG_HPP

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

#ifndef JERUSALEM_CLIENT_ASYNC_CONNECT_HPP
#define JERUSALEM_CLIENT_ASYNC_CONNECT_HPP

#include "err.hpp"
#include <caf/io/network/asio_multiplexer.hpp>
#include <boost/asio/deadline_timer.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace jerusalem { namespace client {

namespace detail {

// Resolver, socket and timer of one connect attempt. All completion
// handlers run on the multiplexer thread, so `done` needs no locking.
struct connect_operation {
  explicit connect_operation(boost::asio::io_service& service)
    : resolver(service)
    , socket(service)
    , timer(service) {
    // nop
  }

  boost::asio::ip::tcp::resolver resolver;
  network::asio_tcp_socket socket;
  boost::asio::deadline_timer timer;
  bool done {false};
};

template <class T>
void handle_connect_completed(T* self, const actor& guard,
                              const std::string& ep_info,
                              const std::shared_ptr<connect_operation>& op,
                              const boost::system::error_code& ec) {
  if (op->done) {
    return;
  }
  op->done = true;
  boost::system::error_code ignored_ec;
  op->timer.cancel(ignored_ec);

  if (self->getf(abstract_actor::is_terminated_flag)) {
    using boost::asio::ip::tcp;
    op->socket.shutdown(tcp::socket::shutdown_both, ignored_ec);
    op->socket.close(ignored_ec);
    return;
  }

  if (ec) {
    anon_send(guard, connect_atom::value,
              make_error(err::connection_error,
                         "could not connect to " + ep_info + ": " + ec.message()));
  } else {
    auto& backend = static_cast<network::asio_multiplexer&>(self->parent().backend());
    auto hdl = backend.add_tcp_scribe(self, std::move(op->socket));
    anon_send(guard, hdl);
  }
}

}

// Resolves and connects to host:port on the broker's multiplexer. The
// broker receives either `connection_handle` (already assigned to it) or
// `(connect_atom, error)`; an attempt still pending after `timeout` fails
// with err::timeout.
template <class T>
void async_connect(T* self, const std::string& host, uint16_t port,
                   std::chrono::milliseconds timeout) {
  using boost::asio::ip::tcp;
  using boost::system::error_code;
  std::string ep_info = host + ":" + std::to_string(port);
  auto guard = actor_cast<actor>(self);
  auto op = std::make_shared<detail::connect_operation>(*self->parent().backend().pimpl());

  op->timer.expires_from_now(boost::posix_time::milliseconds(timeout.count()));
  op->timer.async_wait([self, guard, ep_info, op] (const error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || op->done) {
      return;
    }
    op->done = true;
    error_code ignored_ec;
    op->resolver.cancel();
    op->socket.close(ignored_ec);
    anon_send(guard, connect_atom::value,
              make_error(err::timeout, "connection to " + ep_info + " timed out"));
  });

  op->resolver.async_resolve(tcp::resolver::query(host, std::to_string(port)),
    [self, guard, ep_info, op] (const error_code& ec, tcp::resolver::iterator it) {
      if (ec) {
        detail::handle_connect_completed(self, guard, ep_info, op, ec);
      } else if (!op->done) {
        boost::asio::async_connect(op->socket, it,
          [self, guard, ep_info, op] (const error_code& ec, tcp::resolver::iterator) {
            detail::handle_connect_completed(self, guard, ep_info, op, ec);
          }
        );
      }
    }
  );
}

} }

#endif  // JERUSALEM_CLIENT_ASYNC_CONNECT_HPP

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

#include "test_util.hpp"
#include "tunnel_connection.hpp"

using namespace jerusalem::client;

namespace {

std::vector<char> make_payload(size_t size) {
	std::vector<char> payload(size);
	for (size_t i = 0; i < size; ++i) {
		payload[i] = static_cast<char>((i * 31 + 7) % 251);
	}
	return payload;
}

}

class tunnel_connection_test : public jerusalem_client_test {
protected:
	caf::error run_tunnel(const client_settings& settings,
						  std::shared_ptr<const authenticator> auth,
						  const uuid& connection_id) {
		caf::scoped_actor self(*m_sys);
		auto tunnel = m_sys->middleman().spawn_broker(tunnel_connection_impl, settings,
													  std::move(auth), connection_id);
		self->monitor(tunnel);

		caf::error reason;
		self->receive(
			[&] (const caf::down_msg& msg) {
				reason = msg.reason;
			},
			caf::after(std::chrono::seconds(30)) >> [&] {
				ADD_FAILURE() << "tunnel did not terminate";
				caf::anon_send_exit(tunnel, caf::exit_reason::kill);
			}
		);
		return reason;
	}

	// Server side of a tunnel up to and including the Accept message.
	static mock_relay::socket_ptr accept_tunnel(mock_relay& relay,
												const authenticator* auth,
												const uuid& connection_id) {
		auto sock = relay.accept();
		if (auth) {
			mock_relay::serve_handshake(*sock, *auth, 9000);
		}
		auto msg = mock_relay::receive(*sock);
		EXPECT_EQ(client_message_type::accept, msg.type);
		EXPECT_EQ(connection_id, msg.connection_id);
		return sock;
	}

	void server_to_local(size_t size) {
		auto payload = make_payload(size);
		mock_relay local;
		local.run([&] {
			auto sock = local.accept();
			EXPECT_EQ(payload, mock_relay::read_until_eof(*sock));
		});
		m_relay.run([&] {
			auto sock = accept_tunnel(m_relay, m_auth.get(), m_id);
			mock_relay::send_raw(*sock, payload);
			sock->close();
		});

		auto reason = run_tunnel(make_settings(m_relay.port(), local.port()), m_auth, m_id);
		m_relay.join();
		local.join();
		EXPECT_FALSE(reason) << error_context(reason);
	}

	void local_to_server(size_t size) {
		auto payload = make_payload(size);
		mock_relay local;
		local.run([&] {
			auto sock = local.accept();
			mock_relay::send_raw(*sock, payload);
			sock->close();
		});
		m_relay.run([&] {
			auto sock = accept_tunnel(m_relay, m_auth.get(), m_id);
			EXPECT_EQ(payload, mock_relay::read_until_eof(*sock));
		});

		auto reason = run_tunnel(make_settings(m_relay.port(), local.port()), m_auth, m_id);
		m_relay.join();
		local.join();
		EXPECT_FALSE(reason) << error_context(reason);
	}

	std::shared_ptr<const authenticator> m_auth = std::make_shared<const authenticator>("s3cret");
	uuid m_id = boost::uuids::random_generator()();
	mock_relay m_relay;
};

TEST_F(tunnel_connection_test, empty_server_to_local) {
	server_to_local(0);
}

TEST_F(tunnel_connection_test, single_byte_server_to_local) {
	server_to_local(1);
}

TEST_F(tunnel_connection_test, large_server_to_local) {
	server_to_local(1000000);
}

TEST_F(tunnel_connection_test, empty_local_to_server) {
	local_to_server(0);
}

TEST_F(tunnel_connection_test, single_byte_local_to_server) {
	local_to_server(1);
}

TEST_F(tunnel_connection_test, large_local_to_server) {
	local_to_server(1000000);
}

TEST_F(tunnel_connection_test, local_speaks_first) {
	// as long as the Accept frame, which is acknowledged on the same socket
	auto greeting = make_payload(encode(client_message::make_accept(m_id)).size());
	mock_relay local;
	local.run([&] {
		auto sock = local.accept();
		mock_relay::send_raw(*sock, greeting);
		sock->close();
	});
	m_relay.run([&] {
		auto sock = accept_tunnel(m_relay, m_auth.get(), m_id);
		EXPECT_EQ(greeting, mock_relay::read_until_eof(*sock));
	});

	auto reason = run_tunnel(make_settings(m_relay.port(), local.port()), m_auth, m_id);
	m_relay.join();
	local.join();
	EXPECT_FALSE(reason) << error_context(reason);
}

TEST_F(tunnel_connection_test, without_authentication) {
	auto payload = make_payload(4096);
	mock_relay local;
	local.run([&] {
		auto sock = local.accept();
		EXPECT_EQ(payload, mock_relay::read_until_eof(*sock));
	});
	m_relay.run([&] {
		auto sock = accept_tunnel(m_relay, nullptr, m_id);
		mock_relay::send_raw(*sock, payload);
		sock->close();
	});

	auto reason = run_tunnel(make_settings(m_relay.port(), local.port()), nullptr, m_id);
	m_relay.join();
	local.join();
	EXPECT_FALSE(reason) << error_context(reason);
}

TEST_F(tunnel_connection_test, handshake_rejected) {
	m_relay.run([&] {
		auto sock = m_relay.accept();
		mock_relay::send(*sock, server_message::make_challenge(boost::uuids::random_generator()()));
		mock_relay::receive(*sock);
		mock_relay::send(*sock, server_message::make_error("invalid secret"));
		EXPECT_TRUE(mock_relay::read_until_eof(*sock).empty());
	});

	auto reason = run_tunnel(make_settings(m_relay.port(), 1), m_auth, m_id);
	m_relay.join();
	EXPECT_TRUE(is_error(reason, err::auth_error));
	EXPECT_EQ("client handshake failed: rejection response from server", error_context(reason));
}

TEST_F(tunnel_connection_test, local_connection_refused) {
	uint16_t local_port = 0;
	{
		boost::asio::io_service service;
		boost::asio::ip::tcp::acceptor acceptor(service,
			boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
		local_port = acceptor.local_endpoint().port();
	}

	m_relay.run([&] {
		auto sock = accept_tunnel(m_relay, m_auth.get(), m_id);
		EXPECT_TRUE(mock_relay::read_until_eof(*sock).empty());
	});

	auto reason = run_tunnel(make_settings(m_relay.port(), local_port), m_auth, m_id);
	m_relay.join();
	EXPECT_TRUE(is_error(reason, err::connection_error));
	EXPECT_EQ(0u, error_context(reason).find("failed to connect to local host 127.0.0.1:"
											 + std::to_string(local_port)));
}

TEST_F(echo_test, tunnel_echo) {
	auto auth = std::make_shared<const authenticator>("s3cret");
	auto id = boost::uuids::random_generator()();
	mock_relay relay;
	relay.run([&] {
		auto sock = relay.accept();
		mock_relay::serve_handshake(*sock, *auth, 9000);
		auto msg = mock_relay::receive(*sock);
		EXPECT_EQ(client_message_type::accept, msg.type);
		EXPECT_EQ(id, msg.connection_id);
		std::vector<char> ping {'p', 'i', 'n', 'g'};
		mock_relay::send_raw(*sock, ping);
		EXPECT_EQ(ping, mock_relay::read_until_eof(*sock));
	});

	caf::scoped_actor self(*m_sys);
	auto tunnel = m_sys->middleman().spawn_broker(tunnel_connection_impl,
												  make_settings(relay.port(), m_port), auth, id);
	self->monitor(tunnel);
	self->receive(
		[] (const caf::down_msg& msg) {
			EXPECT_FALSE(msg.reason) << error_context(msg.reason);
		},
		caf::after(std::chrono::seconds(30)) >> [&] {
			ADD_FAILURE() << "tunnel did not terminate";
			caf::anon_send_exit(tunnel, caf::exit_reason::kill);
		}
	);
	relay.join();
}

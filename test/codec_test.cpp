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
#include <boost/uuid/string_generator.hpp>

using namespace jerusalem::client;

namespace {

std::vector<char> bytes(std::initializer_list<int> values) {
	std::vector<char> result;
	for (auto v: values) {
		result.push_back(static_cast<char>(v));
	}
	return result;
}

std::vector<char> payload_of(const std::vector<char>& frame) {
	return std::vector<char>(frame.begin() + FRAME_HEADER_SIZE, frame.end());
}

}

TEST(codec_test, encode_client_hello) {
	EXPECT_EQ(bytes({0, 0, 0, 3, 1, 0x13, 0x88}), encode(client_message::make_hello(5000)));
}

TEST(codec_test, encode_client_authenticate) {
	EXPECT_EQ(bytes({0, 0, 0, 10, 2, 0, 3, 'a', 'b', 'c', 0, 2, 'i', 'd'}),
			  encode(client_message::make_authenticate("abc", "id")));
	EXPECT_EQ(bytes({0, 0, 0, 5, 2, 0, 0, 0, 0}),
			  encode(client_message::make_authenticate("", "")));
}

TEST(codec_test, encode_client_accept) {
	auto id = boost::uuids::string_generator()("00112233-4455-6677-8899-aabbccddeeff");
	EXPECT_EQ(bytes({0, 0, 0, 17, 3,
					 0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
					 0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}),
			  encode(client_message::make_accept(id)));
}

TEST(codec_test, reject_oversized_string) {
	std::string answer(65536, 'x');
	EXPECT_THROW(encode(client_message::make_authenticate(answer, "id")), std::length_error);
}

TEST(codec_test, frame_size_limit) {
	// tag + u16 length + text fills the largest payload exactly
	auto frame = encode(server_message::make_error(std::string(MAX_FRAME_SIZE - 3, 'x')));
	ASSERT_EQ(FRAME_HEADER_SIZE + MAX_FRAME_SIZE, frame.size());
	auto len = decode_frame_header(std::vector<char>(frame.begin(), frame.begin() + FRAME_HEADER_SIZE));
	ASSERT_TRUE(len);
	EXPECT_EQ(MAX_FRAME_SIZE, *len);
	auto msg = decode_server_message(payload_of(frame));
	ASSERT_TRUE(msg);
	EXPECT_EQ(MAX_FRAME_SIZE - 3, msg->what.size());

	EXPECT_THROW(encode(server_message::make_error(std::string(MAX_FRAME_SIZE - 2, 'x'))),
				 std::length_error);
	EXPECT_THROW(encode(client_message::make_authenticate(std::string(40000, 'a'),
														  std::string(40000, 'b'))),
				 std::length_error);
}

TEST(codec_test, decode_frame_header) {
	auto len = decode_frame_header(bytes({0, 0, 1, 0}));
	ASSERT_TRUE(len);
	EXPECT_EQ(256u, *len);

	len = decode_frame_header(bytes({0, 1, 0, 0}));
	ASSERT_TRUE(len);
	EXPECT_EQ(MAX_FRAME_SIZE, *len);

	len = decode_frame_header(bytes({0, 0, 0, 0}));
	ASSERT_FALSE(len);
	EXPECT_TRUE(is_error(len.error(), err::protocol_error));

	len = decode_frame_header(bytes({0, 1, 0, 1}));
	ASSERT_FALSE(len);
	EXPECT_TRUE(is_error(len.error(), err::protocol_error));

	len = decode_frame_header(bytes({0, 0, 1}));
	ASSERT_FALSE(len);
	EXPECT_TRUE(is_error(len.error(), err::protocol_error));
}

TEST(codec_test, decode_server_messages) {
	auto msg = decode_server_message(bytes({2, 0x1f, 0x90}));
	ASSERT_TRUE(msg);
	EXPECT_EQ(server_message_type::free_port, msg->type);
	EXPECT_EQ(8080, msg->port);

	msg = decode_server_message(bytes({3, 0x23, 0x82}));
	ASSERT_TRUE(msg);
	EXPECT_EQ(server_message_type::hello, msg->type);
	EXPECT_EQ(9090, msg->port);

	msg = decode_server_message(bytes({4, 1}));
	ASSERT_TRUE(msg);
	EXPECT_EQ(server_message_type::heartbeat, msg->type);
	EXPECT_TRUE(msg->alive);

	msg = decode_server_message(bytes({6, 0, 10, 'b', 'a', 'd', ' ', 'c', 'l', 'i', 'e', 'n', 't'}));
	ASSERT_TRUE(msg);
	EXPECT_EQ(server_message_type::error, msg->type);
	EXPECT_EQ("bad client", msg->what);
}

TEST(codec_test, decode_server_uuid_messages) {
	auto id = boost::uuids::random_generator()();

	auto msg = decode_server_message(payload_of(encode(server_message::make_challenge(id))));
	ASSERT_TRUE(msg);
	EXPECT_EQ(server_message_type::challenge, msg->type);
	EXPECT_EQ(id, msg->challenge);

	msg = decode_server_message(payload_of(encode(server_message::make_connection(id))));
	ASSERT_TRUE(msg);
	EXPECT_EQ(server_message_type::connection, msg->type);
	EXPECT_EQ(id, msg->connection_id);
}

TEST(codec_test, decode_client_messages) {
	auto msg = decode_client_message(payload_of(encode(client_message::make_authenticate("answer", "client"))));
	ASSERT_TRUE(msg);
	EXPECT_EQ(client_message_type::authenticate, msg->type);
	EXPECT_EQ("answer", msg->answer);
	EXPECT_EQ("client", msg->client_id);
}

TEST(codec_test, reject_malformed_payloads) {
	auto msg = decode_server_message(std::vector<char>());
	ASSERT_FALSE(msg);
	EXPECT_TRUE(is_error(msg.error(), err::protocol_error));

	msg = decode_server_message(bytes({42}));
	ASSERT_FALSE(msg);
	EXPECT_TRUE(is_error(msg.error(), err::protocol_error));
	EXPECT_EQ("unknown server message tag: 42", error_context(msg.error()));

	// truncated
	msg = decode_server_message(bytes({2, 0x1f}));
	ASSERT_FALSE(msg);
	EXPECT_TRUE(is_error(msg.error(), err::protocol_error));

	msg = decode_server_message(bytes({6, 0, 10, 'b', 'a', 'd'}));
	ASSERT_FALSE(msg);
	EXPECT_TRUE(is_error(msg.error(), err::protocol_error));

	msg = decode_server_message(bytes({1, 1, 2, 3}));
	ASSERT_FALSE(msg);
	EXPECT_TRUE(is_error(msg.error(), err::protocol_error));

	// trailing bytes
	msg = decode_server_message(bytes({4, 1, 0}));
	ASSERT_FALSE(msg);
	EXPECT_TRUE(is_error(msg.error(), err::protocol_error));

	auto cmsg = decode_client_message(bytes({9}));
	ASSERT_FALSE(cmsg);
	EXPECT_TRUE(is_error(cmsg.error(), err::protocol_error));
}

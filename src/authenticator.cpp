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
#include "authenticator.hpp"
#include "err.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace jerusalem { namespace client {

namespace {

int hex_value(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	} else if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	} else if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

}

std::string to_hex(const std::vector<uint8_t>& data) {
	static const char digits[] = "0123456789abcdef";
	std::string str;
	str.reserve(data.size() * 2);
	for (auto b : data) {
		str.push_back(digits[b >> 4]);
		str.push_back(digits[b & 0x0F]);
	}
	return str;
}

bool from_hex(const std::string& str, std::vector<uint8_t>& data) {
	if (str.size() % 2 != 0) {
		return false;
	}

	std::vector<uint8_t> out(str.size() / 2);
	for (size_t i = 0; i < out.size(); ++i) {
		auto hi = hex_value(str[i * 2]);
		auto lo = hex_value(str[i * 2 + 1]);
		if (hi < 0 || lo < 0) {
			return false;
		}
		out[i] = static_cast<uint8_t>((hi << 4) | lo);
	}
	data = std::move(out);
	return true;
}

authenticator::authenticator(const std::string& secret) {
	SHA256(reinterpret_cast<const unsigned char*>(secret.data()), secret.size(), m_key.data());
}

std::vector<uint8_t> authenticator::compute(const uuid& challenge) const {
	std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
	unsigned int len = 0;
	HMAC(EVP_sha256(), m_key.data(), static_cast<int>(m_key.size()),
		 challenge.begin(), challenge.size(), mac.data(), &len);
	mac.resize(len);
	return mac;
}

std::string authenticator::generate_answer(const uuid& challenge) const {
	return to_hex(compute(challenge));
}

bool authenticator::validate_answer(const uuid& challenge, const std::string& answer) const {
	std::vector<uint8_t> received;
	if (!from_hex(answer, received)) {
		return false;
	}

	auto expected_mac = compute(challenge);
	if (received.size() != expected_mac.size()) {
		return false;
	}
	return CRYPTO_memcmp(received.data(), expected_mac.data(), expected_mac.size()) == 0;
}

void authenticator::perform_client_handshake(message_channel& channel,
											 const std::string& client_id,
											 std::chrono::milliseconds timeout,
											 handshake_handler handler) const {
	auto ch = &channel;
	channel.receive(timeout, [this, ch, client_id, timeout, handler] (expected<server_message> msg) {
		if (!msg) {
			handler(msg.error());
			return;
		}

		if (msg->type != server_message_type::challenge) {
			handler(make_error(err::auth_error, "no secret provided / invalid secret key"));
			return;
		}

		auto e = ch->send(client_message::make_authenticate(generate_answer(msg->challenge), client_id));
		if (e) {
			handler(std::move(e));
			return;
		}

		ch->receive(timeout, [handler] (expected<server_message> msg) {
			if (!msg) {
				handler(msg.error());
				return;
			}

			if (msg->type != server_message_type::free_port) {
				handler(make_error(err::auth_error, "rejection response from server"));
				return;
			}

			handler(msg->port);
		});
	});
}

} }

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

#ifndef JERUSALEM_CLIENT_AUTHENTICATOR_HPP
#define JERUSALEM_CLIENT_AUTHENTICATOR_HPP

#include "message.hpp"
#include "message_channel.hpp"
#include <openssl/sha.h>
#include <array>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace jerusalem { namespace client {

// Holds the session key, SHA-256 of the shared secret. Immutable after
// construction, so one instance may be shared by every broker.
class authenticator {
public:
	using handshake_handler = std::function<void (expected<uint16_t>)>;

	explicit authenticator(const std::string& secret);

	authenticator(const authenticator&) = delete;
	authenticator& operator = (const authenticator&) = delete;

	// hex(HMAC-SHA256(key, challenge))
	std::string generate_answer(const uuid& challenge) const;

	// False for anything that is not the hex encoding of the expected MAC.
	bool validate_answer(const uuid& challenge, const std::string& answer) const;

	// Challenge -> Authenticate -> FreePort. `handler` receives the granted
	// port, or the error that ended the attempt. Each receive is bounded by
	// `timeout`.
	void perform_client_handshake(message_channel& channel,
								  const std::string& client_id,
								  std::chrono::milliseconds timeout,
								  handshake_handler handler) const;

private:
	std::vector<uint8_t> compute(const uuid& challenge) const;

	std::array<uint8_t, SHA256_DIGEST_LENGTH> m_key;
};

std::string to_hex(const std::vector<uint8_t>& data);
bool from_hex(const std::string& str, std::vector<uint8_t>& data);

} }

#endif  // JERUSALEM_CLIENT_AUTHENTICATOR_HPP

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
#include "err.hpp"

namespace jerusalem { namespace client {

const char* to_string(err code) {
	switch (code) {
	case err::connection_error:
		return "connection_error";
	case err::timeout:
		return "timeout";
	case err::auth_error:
		return "auth_error";
	case err::protocol_error:
		return "protocol_error";
	case err::server_error:
		return "server_error";
	case err::io_error:
		return "io_error";
	case err::config_error:
		return "config_error";
	}
	return "unknown_error";
}

error make_error(err code, std::string what) {
	return error(static_cast<uint8_t>(code), ERROR_CATEGORY, make_message(std::move(what)));
}

error annotate(const error& x, const std::string& prefix) {
	if (x.category() != ERROR_CATEGORY) {
		return x;
	}
	return make_error(static_cast<err>(x.code()), prefix + ": " + error_context(x));
}

bool is_error(const error& x, err code) {
	return x.category() == ERROR_CATEGORY && x.code() == static_cast<uint8_t>(code);
}

std::string error_context(const error& x) {
	if (x.context().empty()) {
		return std::string();
	}
	if (x.context().match_elements<std::string>()) {
		return x.context().get_as<std::string>(0);
	}
	return to_string(x.context());
}

std::string render_error(uint8_t code, atom_value, const message& context) {
	std::string result = to_string(static_cast<err>(code));
	if (context.match_elements<std::string>()) {
		result += ": ";
		result += context.get_as<std::string>(0);
	}
	return result;
}

} }

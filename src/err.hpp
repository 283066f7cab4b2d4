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

#ifndef JERUSALEM_CLIENT_ERR_HPP
#define JERUSALEM_CLIENT_ERR_HPP

#include <string>
#include <cstdint>

namespace jerusalem { namespace client {

const atom_value ERROR_CATEGORY = atom("tunnel");

enum class err : uint8_t {
	connection_error = 1,
	timeout,
	auth_error,
	protocol_error,
	server_error,
	io_error,
	config_error
};

const char* to_string(err code);

error make_error(err code, std::string what);

// Same code and category, context prefixed with `prefix: `.
// Errors of other categories are returned unchanged.
error annotate(const error& x, const std::string& prefix);

bool is_error(const error& x, err code);

std::string error_context(const error& x);

std::string render_error(uint8_t code, atom_value category, const message& context);

} }

#endif  // JERUSALEM_CLIENT_ERR_HPP

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

#ifndef JERUSALEM_CLIENT_LOGGER_HPP
#define JERUSALEM_CLIENT_LOGGER_HPP

#include <string>
#include <fstream>
#include <vector>

namespace jerusalem { namespace client {

using logger = typed_actor<reacts_to<std::string>>;

class logger_state {
public:
	logger_state() = default;

	logger_state(const logger_state&) = delete;
	logger_state& operator = (const logger_state&) = delete;

	void init(const std::string& path);
	bool is_open() const;
	void write(const std::string& content);

private:
	std::ofstream m_fout;
	std::vector<char> m_buf;
};

// Appends every line it receives to `path`, prefixed with the local time.
logger::behavior_type
logger_impl(logger::stateful_pointer<logger_state> self, const std::string& path);

} }

#endif	// JERUSALEM_CLIENT_LOGGER_HPP

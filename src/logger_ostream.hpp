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

#ifndef JERUSALEM_CLIENT_LOGGER_OSTREAM_HPP
#define JERUSALEM_CLIENT_LOGGER_OSTREAM_HPP

#include "logger.hpp"
#include <type_traits>
#include <utility>

namespace jerusalem { namespace client {

// Collects one line and hands it to the logger actor on flush, or to aout
// while no logger has been installed.
class logger_ostream {
public:
	using func_type = logger_ostream& (*)(logger_ostream&);

	// Not synchronized, call before spawning any session.
	static void redirect(logger lgr);
	static void reset();

	explicit logger_ostream(local_actor* self);

	logger_ostream& write(const std::string& content);
	logger_ostream& flush();

	logger_ostream& operator << (const std::string& content);
	logger_ostream& operator << (func_type func);

	template <class T>
	typename std::enable_if<
		!std::is_convertible<T, std::string>::value, logger_ostream&
	>::type operator << (T&& content) {
		using std::to_string;
		using caf::to_string;
		return write(to_string(std::forward<T>(content)));
	}

private:
	static strong_actor_ptr m_logger;
	local_actor* m_self;
	std::string m_content;
};

logger_ostream log(local_actor* self);
logger_ostream log(const scoped_actor& self);

} }

namespace std {

jerusalem::client::logger_ostream& endl(jerusalem::client::logger_ostream& ostrm);
jerusalem::client::logger_ostream& flush(jerusalem::client::logger_ostream& ostrm);

}

#endif	// JERUSALEM_CLIENT_LOGGER_OSTREAM_HPP

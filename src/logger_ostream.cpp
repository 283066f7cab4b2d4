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
#include "logger_ostream.hpp"

namespace jerusalem { namespace client {

strong_actor_ptr logger_ostream::m_logger;

void logger_ostream::redirect(logger lgr) {
	m_logger = actor_cast<strong_actor_ptr>(lgr);
}

void logger_ostream::reset() {
	m_logger.reset();
}

logger_ostream::logger_ostream(local_actor* self)
	: m_self(self) {
	// nop
}

logger_ostream& logger_ostream::write(const std::string& content) {
	m_content += content;
	return *this;
}

logger_ostream& logger_ostream::flush() {
	if (m_logger) {
		anon_send(actor_cast<logger>(m_logger), std::move(m_content));
	} else {
		aout(m_self) << m_content << std::flush;
	}
	m_content.clear();
	return *this;
}

logger_ostream& logger_ostream::operator << (const std::string& content) {
	return write(content);
}

logger_ostream& logger_ostream::operator << (func_type func) {
	return func(*this);
}

logger_ostream log(local_actor* self) {
	return logger_ostream(self);
}

logger_ostream log(const scoped_actor& self) {
	return logger_ostream(self.ptr());
}

} }

namespace std {

jerusalem::client::logger_ostream& endl(jerusalem::client::logger_ostream& ostrm) {
	return ostrm.write("\n").flush();
}

jerusalem::client::logger_ostream& flush(jerusalem::client::logger_ostream& ostrm) {
	return ostrm.flush();
}

}

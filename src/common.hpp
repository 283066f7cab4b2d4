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

#ifndef JERUSALEM_CLIENT_COMMON_HPP
#define JERUSALEM_CLIENT_COMMON_HPP

#include <caf/all.hpp>
#include <caf/io/all.hpp>

namespace jerusalem { namespace client {

const size_t BUFFER_SIZE = 256 * 1024;  // default: 256k

using namespace caf;
using namespace caf::io;

using deadline_atom = atom_constant<atom("deadline")>;
using established_atom = atom_constant<atom("estab")>;

} }

#endif  // JERUSALEM_CLIENT_COMMON_HPP

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
#include "client_config.hpp"
#include "control_session.hpp"
#include "logger.hpp"
#include "logger_ostream.hpp"
#include "err.hpp"
#include <caf/io/network/asio_multiplexer_impl.hpp>
#include <iostream>

using namespace jerusalem;
using namespace jerusalem::client;

int run_client(actor_system& sys, const client_settings& settings) {
	if (!settings.log.empty()) {
		logger_ostream::redirect(sys.spawn(logger_impl, settings.log));
	}

	int ret = 0;
	scoped_actor self(sys);
	auto session = sys.middleman().spawn_broker(control_session_impl, settings,
												actor_cast<actor>(self.ptr()));
	self->monitor(session);

	auto running = true;
	self->receive_while(running) (
		[&] (established_atom, uint16_t port) {
			std::cout << "INFO: jerusalem_client start-up successfully, public port: "
					  << port << std::endl;
		},
		[&] (const down_msg& msg) {
			if (msg.reason) {
				log(self) << "ERROR: " << sys.render(msg.reason) << std::endl;
				ret = 1;
			}
			running = false;
		}
	);
	logger_ostream::reset();
	return ret;
}

int bootstrap(int argc, char* argv[]) {
	client_config cfg;
	cfg.parse(argc, argv);
	if (cfg.cli_helptext_printed) {
		return 0;
	}

	auto settings = cfg.settings();
	if (!cfg.config.empty()) {
		auto e = load_settings(cfg.config, settings);
		if (e) {
			std::cerr << "ERROR: " << render_error(e.code(), e.category(), e.context()) << std::endl;
			return 1;
		}
	}

	auto e = prompt_missing_settings(settings, std::cin, std::cout);
	if (!e) {
		e = validate_settings(settings);
	}
	if (e) {
		std::cerr << "ERROR: " << render_error(e.code(), e.category(), e.context()) << std::endl;
		return 1;
	}

	actor_system sys(cfg);
	return run_client(sys, settings);
}

int main(int argc, char* argv[]) {
	int ret = 0;
	try {
		ret = bootstrap(argc, argv);
	} catch (const std::invalid_argument& e) {
		std::cerr << "ERROR: " << e.what() << std::endl;
		ret = 1;
	}
	return ret;
}

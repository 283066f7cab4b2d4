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
#include "client_settings.hpp"
#include "err.hpp"
#include <rapidxml.hpp>
#include <rapidxml_utils.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <ctype.h>
#include <iostream>
#include <stdexcept>
#include <stdlib.h>

namespace jerusalem { namespace client {

namespace {

const size_t MAX_CLIENT_ID_SIZE = 255;

template <class F>
void read_node(rapidxml::xml_node<>* root, const char* name, F assign) {
	auto node = root->first_node(name);
	if (node) {
		assign(std::string(node->value(), node->value_size()));
	}
}

uint16_t parse_port(const std::string& value) {
	if (value.empty() || !isdigit(static_cast<unsigned char>(value.front()))) {
		throw std::invalid_argument("invalid port: " + value);
	}

	size_t pos = 0;
	auto port = std::stoul(value, &pos);
	if (pos != value.size()) {
		throw std::invalid_argument("invalid port: " + value);
	}
	if (port > UINT16_MAX) {
		throw std::out_of_range("port out of range: " + value);
	}
	return static_cast<uint16_t>(port);
}

std::string env_or_prompt(const char* env, const char* prompt,
						  std::istream& in, std::ostream& out) {
	auto env_value = getenv(env);
	if (env_value && *env_value) {
		return boost::algorithm::trim_copy(std::string(env_value));
	}

	out << prompt << ": " << std::flush;
	std::string value;
	std::getline(in, value);
	boost::algorithm::trim(value);
	return value;
}

}

error load_settings(const std::string& path, client_settings& settings) {
	try {
		rapidxml::file<> fin(path.c_str());
		rapidxml::xml_document<> doc;
		doc.parse<0>(fin.data());
		auto root = doc.first_node("jerusalem_client");
		if (!root) {
			return make_error(err::config_error, "missing <jerusalem_client> node in " + path);
		}

		read_node(root, "server", [&] (std::string value) {
			settings.server_host = std::move(value);
		});
		read_node(root, "server_port", [&] (std::string value) {
			settings.server_port = parse_port(value);
		});
		read_node(root, "local_host", [&] (std::string value) {
			settings.local_host = std::move(value);
		});
		read_node(root, "local_port", [&] (std::string value) {
			settings.local_port = parse_port(value);
		});
		read_node(root, "client_id", [&] (std::string value) {
			settings.client_id = std::move(value);
		});
		read_node(root, "secret_key", [&] (std::string value) {
			settings.secret = std::move(value);
		});
		read_node(root, "timeout", [&] (std::string value) {
			settings.network_timeout = std::chrono::seconds(std::stoul(value));
		});
		read_node(root, "log", [&] (std::string value) {
			settings.log = std::move(value);
		});
		read_node(root, "verbose", [&] (std::string value) {
			settings.verbose = std::stoi(value) != 0;
		});
		return none;
	} catch (const rapidxml::parse_error& e) {
		return make_error(err::config_error,
						  std::string(e.what()) + " [" + e.where<const char>() + "]");
	} catch (const std::logic_error& e) {
		return make_error(err::config_error, "invalid value in " + path + ": " + e.what());
	} catch (const std::runtime_error& e) {
		return make_error(err::config_error, e.what());
	}
}

error prompt_missing_settings(client_settings& settings, std::istream& in, std::ostream& out) {
	if (settings.server_host.empty()) {
		settings.server_host = env_or_prompt("SERVER", "Server address", in, out);
	}
	if (settings.client_id.empty()) {
		settings.client_id = env_or_prompt("CLIENT_ID", "Client ID", in, out);
	}
	if (settings.secret.empty()) {
		settings.secret = env_or_prompt("SECRET_KEY", "Secret key", in, out);
	}
	if (settings.local_host.empty()) {
		settings.local_host = env_or_prompt("LOCAL_HOST", "Local host (default: localhost)", in, out);
		if (settings.local_host.empty()) {
			settings.local_host = DEFAULT_LOCAL_HOST;
		}
	}

	try {
		if (settings.local_port == 0) {
			auto value = env_or_prompt("LOCAL_PORT", "Local port", in, out);
			if (!value.empty()) {
				settings.local_port = parse_port(value);
			}
		}
		if (settings.server_port == 0) {
			auto value = env_or_prompt("SERVER_PORT", "Server port (default: 7835)", in, out);
			settings.server_port = value.empty() ? DEFAULT_SERVER_PORT : parse_port(value);
		}
	} catch (const std::logic_error& e) {
		return make_error(err::config_error, e.what());
	}
	return none;
}

error validate_settings(const client_settings& settings) {
	if (settings.server_host.empty()) {
		return make_error(err::config_error, "server address is required");
	}
	if (settings.server_port == 0) {
		return make_error(err::config_error, "server port is required");
	}
	if (settings.local_host.empty()) {
		return make_error(err::config_error, "local host is required");
	}
	if (settings.local_port == 0) {
		return make_error(err::config_error, "local port is required");
	}
	if (settings.client_id.size() > MAX_CLIENT_ID_SIZE) {
		return make_error(err::config_error, "client id is longer than "
						  + std::to_string(MAX_CLIENT_ID_SIZE) + " bytes");
	}
	if (settings.network_timeout.count() <= 0) {
		return make_error(err::config_error, "network timeout must be positive");
	}
	return none;
}

} }

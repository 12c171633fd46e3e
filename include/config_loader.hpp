#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "server_config.hpp"

namespace shorten {

// Applies SHORTEN_* environment variables on top of `config`.
// @throws std::invalid_argument when a numeric variable does not parse or
//         does not fit its field.
void apply_environment(ServerConfig& config);

// Parses a TCP port number.
// @throws std::invalid_argument unless `text` is an integer in [0, 65535].
uint16_t parse_port(const std::string& text);

// Splits a comma separated origin list, dropping empty entries.
std::vector<std::string> parse_origin_list(const std::string& origins);

// Rejects settings the server cannot start with. Returns an empty string when
// the configuration is usable, otherwise a description of the first problem.
std::string validate_config(const ServerConfig& config);

}

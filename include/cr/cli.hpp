#pragma once

#include "cr/options.hpp"

namespace cr {

void print_usage(const char* prog);

// Returns false on --help or a usage error (message already printed).
bool parse_args(int argc, char** argv, Options& opt);

} // namespace cr

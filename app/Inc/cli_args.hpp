/*
 * cli_args.hpp
 *
 * flag value parsing for the command line front end
 */

#pragma once
#include <cstddef>
#include "vfd/types.hpp"

namespace vfd_app {

// x|y|z, either case
bool parse_axis(const char* s, vfd::AxisId& out);

// plain decimal digits only, a sign or overflow is rejected
bool parse_size(const char* s, size_t& out);

// whole string must be a finite number
bool parse_double(const char* s, double& out);

} // namespace vfd_app

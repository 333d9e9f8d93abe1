#pragma once
#include <optional>
#include <string>
#include "vfd/types.hpp"

namespace vfd{

// accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS[.ffffff]" (space or 'T', optional trailing 'Z')
// and bare numbers as epoch seconds. anything else gives nullopt
std::optional<Timestamp> parse_timestamp(const std::string& text);

// coerces a cell to a timestamp, Null and unparseable cells give nullopt
std::optional<Timestamp> cell_to_timestamp(const Cell& c);

// coerces a cell to a number (text is parsed, times are rejected)
std::optional<double> cell_to_number(const Cell& c);

// "%Y-%m-%d %H:%M:%S", sub-second part dropped
std::string format_timestamp(Timestamp t_us);

// civil date helpers (proleptic gregorian, UTC)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d);
void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d);

} // namespace vfd

/*
 * csv_sheet.hpp
 *
 * loads asset sheets for the command line front end. one CSV file is one sheet,
 * a directory is a workbook (every *.csv inside, sorted by name)
 */

#pragma once
#include <string>
#include <vector>
#include "vfd/types.hpp"

namespace vfd_app {

// header line gives the column labels, empty fields become Null cells and the
// rest stay Text (the normalizer does the coercion). false if the file cannot be read
bool load_csv_sheet(const std::string& path, vfd::RawSheet& out, std::string& err);

// expands directories into their *.csv files
std::vector<std::string> collect_sheet_paths(const std::vector<std::string>& args);

// splits one CSV line, double quotes group a field and "" is a literal quote
std::vector<std::string> split_csv_line(const std::string& line, char sep = ',');

} // namespace vfd_app

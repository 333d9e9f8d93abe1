#pragma once
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>
#include "vfd/aggregator.hpp"

namespace vfd{

// one table line for the time-domain summary
struct SummaryRow {
    std::string sheet;
    std::string timestamp;      //"%Y-%m-%d %H:%M:%S"
    std::string issue;          //"Radial High, Looseness"
};

// one table line for the spectral summary
struct SpectralRow {
    std::string sheet;
    char axis = 'x';
    double peak_hz = 0.0;
    double peak_rpm = 0.0;
    double amplitude = 0.0;
    std::string label;
};

// fault rows only, in sheet order then time order. last_n > 0 keeps the newest last_n per sheet
std::vector<SummaryRow> summary_rows(const BatchSummary& b, size_t last_n = 0);

// every axis of every spectral entry
std::vector<SpectralRow> spectral_rows(const BatchSummary& b);

// plain text tables for the console, returns the number of data lines written
size_t write_summary(std::FILE* out, const BatchSummary& b, size_t last_n = 0);

} // namespace vfd

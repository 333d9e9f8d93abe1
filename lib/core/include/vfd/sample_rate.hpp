#pragma once
#include <cstdint>
#include <vector>
#include "vfd/types.hpp"

namespace vfd{

enum class RateMethod : uint8_t {
    Median = 0,         //median of consecutive diffs, robust to gaps and duplicates
    Mean = 1,           //mean of consecutive diffs
    FirstInterval = 2   //t[1] - t[0] only
};

// effective sampling frequency in Hz. returns 0 when it cannot be determined
// (fewer than 2 samples, or a non-positive interval), never NaN or inf
double estimate_sample_rate(const std::vector<NormalizedSample>& samples,
                            RateMethod method = RateMethod::Median);

// same, straight from a timestamp column
double estimate_sample_rate(const std::vector<Timestamp>& t_us,
                            RateMethod method = RateMethod::Median);

} // namespace vfd

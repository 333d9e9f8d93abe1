#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "vfd/types.hpp"

namespace vfd{

// trailing window length for RMS, in seconds of signal
constexpr double kRmsWindowSeconds = 60.0;
// std-dev window, in samples
constexpr int kStdWindowSamples = 3;

// rolling window with running sums (implemented manually for portability)
class RollingWindow {
public:
    explicit RollingWindow(int window);
    void reset();
    void push(double x);
    int size()          const {return n_;}
    int capacity()      const {return win_;}
    bool full()         const {return n_ == win_;}
    double mean()       const;
    double mean_sq()    const;  // E[x^2]
    double rms()        const;  // sqrt(E[x^2]), 0 when empty
    double var_pop()    const;  // divides by n, 0 when empty
    double std_pop()    const;

private:
    int win_;
    int n_ = 0;
    int head_ = 0;
    std::vector<double> buf_;
    double sum_ = 0.0;
    double sumsq_ = 0.0;

    void resum_();
};

// window for RMS mode, max(1, floor(rate * 60)). a rate of 0 gives 1
int rms_window_samples(double sample_rate_hz);

// causal RMS, current sample included, min_periods = 1 so every row has a value
std::vector<double> rolling_rms(const std::vector<double>& v, int window);

// causal population std-dev, the first window-1 rows are empty
std::vector<std::optional<double>> rolling_std(const std::vector<double>& v, int window);

enum class StatMode : uint8_t {
    Rms = 0,
    StdDev = 1
};

// one row of per-axis statistics, aligned with the input samples
struct AxisStats {
    std::optional<double> x, y, z;
    bool complete() const {return x.has_value() && y.has_value() && z.has_value();}
};

class RollingStatEngine {
public:
    RollingStatEngine(StatMode mode, double sample_rate_hz);

    std::vector<AxisStats> compute(const std::vector<NormalizedSample>& samples) const;

    StatMode mode() const {return mode_;}
    int window() const {return window_;}

private:
    StatMode mode_;
    int window_;

    static std::vector<double> column_(const std::vector<NormalizedSample>& s, AxisId a);
};

} // namespace vfd

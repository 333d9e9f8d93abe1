#include "vfd/rolling.hpp"
#include <algorithm>
#include <climits>
#include <cmath>

namespace vfd{

// any variable with a _ denotes it is a member variable

// Rolling Window
RollingWindow::RollingWindow(int window) : win_(std::max(1, window)), buf_(win_, 0.0) {}

void RollingWindow::reset(){
    std::fill(buf_.begin(), buf_.end(), 0.0);      // this clears buffer to all zeros
    n_ = 0;
    head_ = 0;
    sum_ = 0.0;
    sumsq_ = 0.0;
}

void RollingWindow::push(double x){
    // buffer not yet full
    if (n_ < win_) {
        buf_[head_] = x;
        head_ = (head_ + 1) % win_;
        n_++;
        sum_ += x;
        sumsq_ += x * x;
    } else { // full, overwrite oldest val
        double old = buf_[head_];
        buf_[head_] = x;
        head_ = (head_ + 1) % win_;
        sum_ += x - old;
        sumsq_ += x * x - old * old;
        if (head_ == 0) resum_();       //once per lap, keeps rounding drift bounded
    }
}

void RollingWindow::resum_(){
    sum_ = 0.0;
    sumsq_ = 0.0;
    for (double v : buf_) {
        sum_ += v;
        sumsq_ += v * v;
    }
}

double RollingWindow::mean() const {
    if (n_ == 0) return 0.0;
    return sum_ / double(n_);
}

double RollingWindow::mean_sq() const {
    if (n_ == 0) return 0.0;
    return std::max(0.0, sumsq_ / double(n_));     //running sums can dip below 0 by rounding
}

double RollingWindow::rms() const {
    return std::sqrt(mean_sq());
}

double RollingWindow::var_pop() const {
    if (n_ == 0) return 0.0;
    double mu = mean();
    return std::max(0.0, mean_sq() - mu * mu);
}

double RollingWindow::std_pop() const {
    return std::sqrt(var_pop());
}

int rms_window_samples(double sample_rate_hz){
    if (!(sample_rate_hz > 0.0) || !std::isfinite(sample_rate_hz)) return 1;
    const double n = std::floor(sample_rate_hz * kRmsWindowSeconds);
    if (n >= double(INT_MAX)) return INT_MAX;
    return std::max(1, int(n));
}

std::vector<double> rolling_rms(const std::vector<double>& v, int window){
    //never allocate more than the series needs
    const int w = std::max(1, std::min(window, int(std::min<size_t>(v.size() + 1, INT_MAX))));
    RollingWindow rw(w);
    std::vector<double> out;
    out.reserve(v.size());
    for (double x : v){
        rw.push(x);
        out.push_back(rw.rms());
    }
    return out;
}

std::vector<std::optional<double>> rolling_std(const std::vector<double>& v, int window){
    const int w = std::max(1, window);
    RollingWindow rw(w);
    std::vector<std::optional<double>> out;
    out.reserve(v.size());
    for (double x : v){
        rw.push(x);
        if (rw.full()) out.push_back(rw.std_pop());
        else           out.push_back(std::nullopt);     //partial window, no value yet
    }
    return out;
}

RollingStatEngine::RollingStatEngine(StatMode mode, double sample_rate_hz)
: mode_(mode),
  window_(mode == StatMode::Rms ? rms_window_samples(sample_rate_hz) : kStdWindowSamples) {}

std::vector<double> RollingStatEngine::column_(const std::vector<NormalizedSample>& s, AxisId a){
    std::vector<double> out;
    out.reserve(s.size());
    for (const NormalizedSample& smp : s) out.push_back(axis_value(smp, a));
    return out;
}

std::vector<AxisStats> RollingStatEngine::compute(const std::vector<NormalizedSample>& samples) const {
    std::vector<AxisStats> out(samples.size());
    const AxisId axes[3] = {AxisId::X, AxisId::Y, AxisId::Z};

    for (AxisId a : axes){
        const std::vector<double> col = column_(samples, a);
        std::vector<std::optional<double>> stat;
        if (mode_ == StatMode::Rms){
            std::vector<double> rms = rolling_rms(col, window_);
            stat.assign(rms.begin(), rms.end());
        } else {
            stat = rolling_std(col, window_);
        }

        for (size_t i = 0; i < out.size(); ++i){
            switch (a){
                case AxisId::X: out[i].x = stat[i]; break;
                case AxisId::Y: out[i].y = stat[i]; break;
                case AxisId::Z: out[i].z = stat[i]; break;
            }
        }
    }
    return out;
}

} // namespace vfd

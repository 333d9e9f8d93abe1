#include "vfd/sample_rate.hpp"
#include <algorithm>
#include <cmath>

namespace vfd{

double estimate_sample_rate(const std::vector<Timestamp>& t_us, RateMethod method){
    if (t_us.size() < 2) return 0.0;

    //consecutive diffs in seconds, duplicates give 0 and stay in
    std::vector<double> dt;
    dt.reserve(t_us.size() - 1);
    for (size_t i = 0; i + 1 < t_us.size(); ++i)
        dt.push_back(double(t_us[i + 1] - t_us[i]) / double(kUsPerSecond));

    double interval = 0.0;
    switch (method){
        case RateMethod::FirstInterval:
            interval = dt.front();
            break;

        case RateMethod::Mean: {
            double sum = 0.0;
            for (double d : dt) sum += d;
            interval = sum / double(dt.size());
            break;
        }

        case RateMethod::Median:
        default: {
            //even count averages the two middle values
            const size_t n = dt.size();
            const size_t mid = n / 2;
            std::nth_element(dt.begin(), dt.begin() + mid, dt.end());
            double hi = dt[mid];
            if (n % 2 == 1){
                interval = hi;
            } else {
                double lo = *std::max_element(dt.begin(), dt.begin() + mid);
                interval = 0.5 * (lo + hi);
            }
            break;
        }
    }

    if (!(interval > 0.0) || !std::isfinite(interval)) return 0.0;
    return 1.0 / interval;
}

double estimate_sample_rate(const std::vector<NormalizedSample>& samples, RateMethod method){
    std::vector<Timestamp> t;
    t.reserve(samples.size());
    for (const NormalizedSample& s : samples) t.push_back(s.t_us);
    return estimate_sample_rate(t, method);
}

} // namespace vfd

#include "vfd/spectral.hpp"
#include <fftw3.h>
#include <algorithm>
#include <climits>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace vfd{

namespace {

struct FftwFree {
    void operator()(void* p) const {fftw_free(p);}
};

struct FftwPlanDestroy {
    void operator()(fftw_plan p) const {fftw_destroy_plan(p);}
};

using RealBuf = std::unique_ptr<double, FftwFree>;
using ComplexBuf = std::unique_ptr<fftw_complex, FftwFree>;
using Plan = std::unique_ptr<std::remove_pointer<fftw_plan>::type, FftwPlanDestroy>;

} // namespace

const char* to_string(SpectralFault f){
    switch (f){
        case SpectralFault::LikelyUnbalance:      return "Likely Unbalance";
        case SpectralFault::PossibleMisalignment: return "Possible Misalignment";
        case SpectralFault::PossibleBearingFault: return "Possible Bearing Fault";
        case SpectralFault::PossibleLooseness:    return "Possible Looseness";
        case SpectralFault::NoDominantFault:
        default:                                  return "No dominant fault detected";
    }
}

Spectrum one_sided_spectrum(const std::vector<double>& v, double sample_rate_hz){
    Spectrum out{};
    const size_t N = v.size();
    if (N == 0 || !(sample_rate_hz > 0.0)) return out;
    if (N > size_t(INT_MAX)) throw std::runtime_error("fft input too long");

    const int n = static_cast<int>(N);
    RealBuf in(static_cast<double*>(fftw_malloc(sizeof(double) * N)));
    ComplexBuf spec(static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (N / 2 + 1))));
    if (!in || !spec) throw std::runtime_error("fftw_malloc failed");

    //plan before filling, planning may scribble on the buffers
    Plan plan(fftw_plan_dft_r2c_1d(n, in.get(), spec.get(), FFTW_ESTIMATE));
    if (!plan) throw std::runtime_error("fftw plan failed");

    //remove DC (mean) component
    double mean = 0.0;
    for (double x : v) mean += x;
    mean /= double(N);
    for (size_t i = 0; i < N; ++i) in.get()[i] = v[i] - mean;

    fftw_execute(plan.get());

    //first ceil(N/2) bins of the r2c output
    const size_t half = (N + 1) / 2;
    const double scale = 2.0 / double(N);
    const double df = sample_rate_hz / double(N);
    out.frequencies.resize(half);
    out.magnitudes.resize(half);
    for (size_t k = 0; k < half; ++k){
        const double re = spec.get()[k][0];
        const double im = spec.get()[k][1];
        out.frequencies[k] = double(k) * df;
        out.magnitudes[k] = std::sqrt(re * re + im * im) * scale;
    }
    return out;
}

std::optional<SpectralPeak> find_peak(const Spectrum& s, AxisId axis, bool skip_dc_bin){
    const size_t first = skip_dc_bin ? 1 : 0;
    if (s.magnitudes.size() <= first) return std::nullopt;

    //strict > keeps the lowest bin on ties
    size_t best = first;
    for (size_t k = first + 1; k < s.magnitudes.size(); ++k){
        if (s.magnitudes[k] > s.magnitudes[best]) best = k;
    }

    SpectralPeak p{};
    p.axis = axis;
    p.bin = best;
    p.frequency_hz = s.frequencies[best];
    p.amplitude = s.magnitudes[best];
    return p;
}

SpectralFault classify_peak(const SpectralPeak& peak, double rpm){
    const double peak_rpm = peak.rpm();
    const double f = peak.frequency_hz;

    if (std::fabs(peak_rpm - rpm) < kHarmonicToleranceRpm)
        return SpectralFault::LikelyUnbalance;
    if (std::fabs(peak_rpm - 2.0 * rpm) < kHarmonicToleranceRpm)
        return SpectralFault::PossibleMisalignment;
    if (f > kBearingBandHz)
        return SpectralFault::PossibleBearingFault;
    if (f > 0.0 && f < kLoosenessBandHz && peak.amplitude > kLoosenessAmplitude)
        return SpectralFault::PossibleLooseness;
    return SpectralFault::NoDominantFault;
}

SpectralAnalyzer::SpectralAnalyzer(const SpectralConfig& cfg) : cfg_(cfg) {}

SpectralResult SpectralAnalyzer::analyze(const std::vector<NormalizedSample>& samples,
                                         double rpm, double sample_rate_hz) const {
    SpectralResult out{};
    out.sample_rate_hz = sample_rate_hz;
    out.rpm = rpm;
    out.n = samples.size();
    if (samples.size() < 2 || !(sample_rate_hz > 0.0)) return out;

    const AxisId axes[3] = {AxisId::X, AxisId::Y, AxisId::Z};
    for (AxisId a : axes){
        std::vector<double> col;
        col.reserve(samples.size());
        for (const NormalizedSample& s : samples) col.push_back(axis_value(s, a));

        AxisSpectrum as{};
        as.axis = a;
        as.spectrum = one_sided_spectrum(col, sample_rate_hz);

        std::optional<SpectralPeak> peak = find_peak(as.spectrum, a, cfg_.skip_dc_bin);
        if (peak){
            as.peak = *peak;
            as.label = classify_peak(*peak, rpm);
        } else {
            as.peak.axis = a;       //only bin 0 and it was skipped
            as.label = SpectralFault::NoDominantFault;
        }
        out.axes.push_back(std::move(as));
    }
    out.valid = true;
    return out;
}

} // namespace vfd

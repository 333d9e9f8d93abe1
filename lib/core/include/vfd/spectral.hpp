#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "vfd/types.hpp"

namespace vfd{

constexpr double kHarmonicToleranceRpm = 5.0;   //|peak_rpm - k*rpm| below this matches
constexpr double kBearingBandHz = 500.0;        //peaks above are high frequency energy
constexpr double kLoosenessBandHz = 10.0;       //peaks below (and above 0) are low frequency
constexpr double kLoosenessAmplitude = 0.1;

// first match wins, in this order
enum class SpectralFault : uint8_t {
    LikelyUnbalance = 0,        // 1x shaft speed
    PossibleMisalignment = 1,   // 2x shaft speed
    PossibleBearingFault = 2,
    PossibleLooseness = 3,
    NoDominantFault = 4
};

const char* to_string(SpectralFault f);

// one-sided magnitude spectrum, both vectors have ceil(N/2) entries
struct Spectrum {
    std::vector<double> frequencies;    //Hz, k * fs / N
    std::vector<double> magnitudes;     //|X_k| * 2 / N
};

struct SpectralPeak {
    AxisId axis = AxisId::X;
    double frequency_hz = 0.0;
    double amplitude = 0.0;
    size_t bin = 0;

    double rpm() const {return frequency_hz * 60.0;}
};

struct SpectralConfig {
    // bin 0 is part of the peak search by default. the mean is removed before the
    // transform so it rarely wins, but slow drift can still put energy there
    bool skip_dc_bin = false;
};

struct AxisSpectrum {
    AxisId axis = AxisId::X;
    Spectrum spectrum;
    SpectralPeak peak;
    SpectralFault label = SpectralFault::NoDominantFault;
};

struct SpectralResult {
    bool valid = false;         //false when N < 2 or the sample rate is undetermined
    double sample_rate_hz = 0.0;
    double rpm = 0.0;
    size_t n = 0;               //samples per axis
    std::vector<AxisSpectrum> axes;     //x, y, z
};

// mean removed, FFTW real-to-complex transform. throws std::runtime_error if FFTW
// cannot allocate or plan. empty input or a rate <= 0 gives an empty spectrum
Spectrum one_sided_spectrum(const std::vector<double>& v, double sample_rate_hz);

// global maximum, ties go to the lower bin. nullopt when nothing is searchable
std::optional<SpectralPeak> find_peak(const Spectrum& s, AxisId axis, bool skip_dc_bin = false);

SpectralFault classify_peak(const SpectralPeak& peak, double rpm);

class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(const SpectralConfig& cfg = SpectralConfig{});

    // whole window per axis, no sub-windowing
    SpectralResult analyze(const std::vector<NormalizedSample>& samples,
                           double rpm, double sample_rate_hz) const;

private:
    SpectralConfig cfg_;
};

} // namespace vfd

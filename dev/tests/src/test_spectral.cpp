#include "vfd/types.hpp"
#include "vfd/spectral.hpp"
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

using namespace vfd;

//purpose of this test is to check the one-sided FFT spectrum, the peak search and the harmonic rules
//g++ -std=c++17 -I lib/core/include \
  dev/tests/src/test_spectral.cpp \
  lib/core/src/spectral.cpp \
  -lfftw3 -o /tmp/test_spectral && /tmp/test_spectral

static int g_fail = 0;
static const double kPi = 3.14159265358979323846;

static void test_near(const char* name, double got, double want, double eps=1e-3){
    double err = std::fabs(got-want);
    if (err > eps || std::isnan(got)) {std::printf("[FAIL] %s: got=%.6f want=%.6f (|err|=%.6f)\n", name, got, want, err); g_fail++;}
    else                              std::printf("[PASS] %s: got=%.6f want=%.6f\n", name, got, want);
}
static void test_bool(const char* name, bool got, bool want){
    if (got != want) {std::printf("[FAIL] %s: got=%d want=%d\n", name, got, want); g_fail++;}
    else             std::printf("[PASS] %s: got=%d want=%d\n", name, got, want);
}
static void test_label(const char* name, SpectralFault got, SpectralFault want){
    if (got != want) {std::printf("[FAIL] %s: got=%s want=%s\n", name, to_string(got), to_string(want)); g_fail++;}
    else             std::printf("[PASS] %s: %s\n", name, to_string(got));
}

static std::vector<double> sine(size_t n, double f, double amp, double fs, double offset = 0.0){
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = offset + amp * std::sin(2.0 * kPi * f * double(i) / fs);
    return v;
}

// same signal on all three axes
static std::vector<NormalizedSample> samples_from(const std::vector<double>& v, double fs){
    std::vector<NormalizedSample> s(v.size());
    for (size_t i = 0; i < v.size(); ++i){
        s[i].t_us = Timestamp(std::llround(double(i) * 1e6 / fs));
        s[i].x = v[i]; s[i].y = v[i]; s[i].z = v[i];
    }
    return s;
}

int main() {

    // test 1 spectrum shape: ceil(N/2) bins at fs/N spacing
    Spectrum even = one_sided_spectrum(sine(1000, 30.0, 1.0, 1000.0), 1000.0);
    test_bool("even bins", even.magnitudes.size() == 500 && even.frequencies.size() == 500, true);
    test_near("bin width", even.frequencies[1], 1.0, 1e-12);
    Spectrum odd = one_sided_spectrum(sine(7, 1.0, 1.0, 7.0), 7.0);
    test_bool("odd bins", odd.magnitudes.size() == 4, true);
    test_bool("empty input", one_sided_spectrum({}, 100.0).magnitudes.empty(), true);
    test_bool("zero rate", one_sided_spectrum({1.0, 2.0}, 0.0).magnitudes.empty(), true);

    // test 2 2/N scaling recovers the sine amplitude, offset is removed
    Spectrum amp = one_sided_spectrum(sine(1000, 30.0, 0.8, 1000.0, 5.0), 1000.0);
    auto p_amp = find_peak(amp, AxisId::X);
    test_bool("peak found", p_amp.has_value(), true);
    if (p_amp){
        test_near("peak freq", p_amp->frequency_hz, 30.0, 1e-9);
        test_near("peak amplitude", p_amp->amplitude, 0.8, 1e-6);
        test_near("peak rpm", p_amp->rpm(), 1800.0, 1e-6);
    }
    test_near("dc after mean removal", amp.magnitudes[0], 0.0, 1e-9);

    // test 3 pure 1x at 1800 rpm -> unbalance, on every axis
    const double rpm = 1800.0;
    const double f0 = rpm / 60.0;
    SpectralAnalyzer analyzer;
    SpectralResult r1 = analyzer.analyze(samples_from(sine(1000, f0, 1.0, 1000.0), 1000.0), rpm, 1000.0);
    test_bool("1x valid", r1.valid && r1.axes.size() == 3, true);
    for (const AxisSpectrum& a : r1.axes){
        test_near("1x peak within one bin", a.peak.frequency_hz, f0, 1000.0 / 1000.0);
        test_label("1x label", a.label, SpectralFault::LikelyUnbalance);
    }
    if (r1.axes.size() == 3) test_bool("axis order", r1.axes[2].axis == AxisId::Z, true);

    // test 4 off-bin 1x, fs 512 N 1000 (bin 0.512 Hz), the peak still lands within one bin
    SpectralResult r1b = analyzer.analyze(samples_from(sine(1000, f0, 1.0, 512.0), 512.0), rpm, 512.0);
    if (!r1b.axes.empty()) test_near("off-bin peak", r1b.axes[0].peak.frequency_hz, f0, 512.0 / 1000.0);
    else test_bool("r1b has axes", false, true);

    // test 5 pure 2x -> misalignment
    SpectralResult r2 = analyzer.analyze(samples_from(sine(1000, 2.0 * f0, 1.0, 1000.0), 1000.0), rpm, 1000.0);
    if (!r2.axes.empty()) test_label("2x label", r2.axes[0].label, SpectralFault::PossibleMisalignment);
    else test_bool("r2 has axes", false, true);

    // test 6 high frequency -> bearing
    SpectralResult r3 = analyzer.analyze(samples_from(sine(2000, 600.0, 0.2, 2000.0), 2000.0), rpm, 2000.0);
    if (!r3.axes.empty()) test_label("600 Hz label", r3.axes[0].label, SpectralFault::PossibleBearingFault);
    else test_bool("r3 has axes", false, true);

    // test 7 low frequency, strong vs weak
    SpectralResult r4 = analyzer.analyze(samples_from(sine(1000, 5.0, 0.5, 1000.0), 1000.0), rpm, 1000.0);
    if (!r4.axes.empty()) test_label("5 Hz strong", r4.axes[0].label, SpectralFault::PossibleLooseness);
    else test_bool("r4 has axes", false, true);
    SpectralResult r5 = analyzer.analyze(samples_from(sine(1000, 5.0, 0.05, 1000.0), 1000.0), rpm, 1000.0);
    if (!r5.axes.empty()) test_label("5 Hz weak", r5.axes[0].label, SpectralFault::NoDominantFault);
    else test_bool("r5 has axes", false, true);

    // test 8 somewhere in between -> nothing
    SpectralResult r6 = analyzer.analyze(samples_from(sine(1000, 100.0, 1.0, 1000.0), 1000.0), rpm, 1000.0);
    if (!r6.axes.empty()) test_label("100 Hz", r6.axes[0].label, SpectralFault::NoDominantFault);
    else test_bool("r6 has axes", false, true);

    // test 9 rule order: 600 Hz is both 1x of 36000 rpm and above 500 Hz, first rule wins
    SpectralPeak both{};
    both.frequency_hz = 600.0;
    both.amplitude = 1.0;
    test_label("first match wins", classify_peak(both, 36000.0), SpectralFault::LikelyUnbalance);
    SpectralPeak edge{};
    edge.frequency_hz = 5.0;
    edge.amplitude = 0.1;
    test_label("looseness amplitude strict", classify_peak(edge, rpm), SpectralFault::NoDominantFault);
    SpectralPeak tol{};
    tol.frequency_hz = (rpm + 6.0) / 60.0;
    tol.amplitude = 1.0;
    test_label("outside tolerance", classify_peak(tol, rpm), SpectralFault::NoDominantFault);

    // test 10 bin 0 takes part in the peak search unless skip_dc_bin is set
    Spectrum dc{};
    dc.frequencies = {0.0, 1.0, 2.0, 3.0};
    dc.magnitudes = {0.9, 0.2, 0.5, 0.1};
    auto pd = find_peak(dc, AxisId::Y);
    test_bool("dc bin can win", pd.has_value() && pd->bin == 0, true);
    auto ps = find_peak(dc, AxisId::Y, true);
    test_bool("dc bin skipped", ps.has_value() && ps->bin == 2, true);
    Spectrum only_dc{};
    only_dc.frequencies = {0.0};
    only_dc.magnitudes = {1.0};
    test_bool("nothing left after skip", find_peak(only_dc, AxisId::Z, true).has_value(), false);

    //flat signal: every bin is 0, the tie goes to bin 0 and nothing is diagnosed
    SpectralResult flat = analyzer.analyze(samples_from(std::vector<double>(64, 0.25), 64.0), rpm, 64.0);
    if (!flat.axes.empty()){
        test_bool("flat peak at dc", flat.axes[0].peak.bin == 0, true);
        test_label("flat label", flat.axes[0].label, SpectralFault::NoDominantFault);
    } else {
        test_bool("flat has axes", false, true);
    }
    SpectralConfig skip{};
    skip.skip_dc_bin = true;
    SpectralResult flat2 = SpectralAnalyzer(skip).analyze(samples_from(std::vector<double>(64, 0.25), 64.0), rpm, 64.0);
    if (!flat2.axes.empty()) test_bool("flat peak skip dc", flat2.axes[0].peak.bin == 1, true);
    else test_bool("flat2 has axes", false, true);

    // test 11 degenerate input is flagged, not computed
    test_bool("one sample invalid", analyzer.analyze(samples_from({1.0}, 10.0), rpm, 10.0).valid, false);
    test_bool("zero rate invalid", analyzer.analyze(samples_from({1.0, 2.0, 3.0}, 10.0), rpm, 0.0).valid, false);

    return g_fail ? 1 : 0;
}

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "vfd/types.hpp"
#include "vfd/normalizer.hpp"
#include "vfd/sample_rate.hpp"
#include "vfd/rolling.hpp"
#include "vfd/classifier.hpp"
#include "vfd/spectral.hpp"

namespace vfd{

enum class DiagnosisMode : uint8_t {
    RollingRms = 0,     //60 s trailing RMS + RMS thresholds
    RollingStd = 1,     //3 sample std-dev + raw value thresholds
    Spectral = 2        //whole window FFT peak vs shaft speed
};

// anchored at the newest timestamp of the sheet
enum class TimeWindow : uint8_t {
    All = 0,
    Last24h = 1,
    Last7d = 2
};

// everything one run needs, built once by the caller
struct AnalysisConfig {
    DiagnosisMode mode = DiagnosisMode::RollingRms;
    double rpm = 1800.0;                    //shaft speed, only the spectral path reads it
    std::string orientation = "Horizontal"; //informational, no rule reads it
    TimeWindow window = TimeWindow::All;
    size_t max_rows = 0;                    //most recent N rows, 0 = no cap
    RateMethod rate_method = RateMethod::Median;

    NormalizeConfig norm{};                 //axial axis + column contract
    SpectralConfig spectral{};
};

struct TimeDiagnosis {
    Timestamp t_us = 0;
    LabelSet labels;

    bool normal() const {return labels.empty();}
    std::string text() const {return labels.text();}
};

struct SpectralDiagnosis {
    AxisId axis = AxisId::X;
    double peak_frequency_hz = 0.0;
    double peak_amplitude = 0.0;
    SpectralFault label = SpectralFault::NoDominantFault;
    Spectrum spectrum;      //for plotting

    double peak_rpm() const {return peak_frequency_hz * 60.0;}
};

using TimeDiagnoses = std::vector<TimeDiagnosis>;
using SpectralDiagnoses = std::vector<SpectralDiagnosis>;

// one of the two result kinds, picked by DiagnosisMode
using DiagnosisSet = std::variant<TimeDiagnoses, SpectralDiagnoses>;

enum class SheetStatus : uint8_t {
    Ok = 0,
    InvalidSchema = 1,      //required columns missing
    InsufficientData = 2,   //< 2 samples in the window, or spectral mode with an undetermined sample rate
    Failed = 3              //unexpected error, sheet skipped
};

const char* to_string(SheetStatus s);

struct SheetReport {
    std::string sheet;
    SheetStatus status = SheetStatus::Ok;
    std::string detail;                     //human readable reason when not Ok
    std::vector<std::string> missing_columns;
    double sample_rate_hz = 0.0;            //estimated on the whole normalized sheet
    size_t rows_total = 0;                  //after normalization
    size_t rows_used = 0;                   //after time window and row cap
    DiagnosisSet diagnoses;

    bool spectral() const {return std::holds_alternative<SpectralDiagnoses>(diagnoses);}
};

// keeps t >= newest - span. input must be sorted ascending
std::vector<NormalizedSample> apply_time_window(const std::vector<NormalizedSample>& samples, TimeWindow w);

// last max_rows samples, 0 keeps everything
std::vector<NormalizedSample> tail_rows(const std::vector<NormalizedSample>& samples, size_t max_rows);

// rows whose statistics are still undefined are left out
TimeDiagnoses diagnose_time_domain(const std::vector<NormalizedSample>& samples,
                                   StatMode mode, double sample_rate_hz);

SpectralDiagnoses diagnose_spectral(const std::vector<NormalizedSample>& samples,
                                    double rpm, double sample_rate_hz,
                                    const SpectralConfig& cfg = SpectralConfig{});

// normalize -> rate -> window/cap -> mode. data problems come back as a status, not an exception
SheetReport run_sheet(const RawSheet& sheet, const AnalysisConfig& cfg);

// time-domain rows that carry at least one label
TimeDiagnoses fault_rows(const SheetReport& r);

// the newest k of those
TimeDiagnoses last_faults(const SheetReport& r, size_t k);

} // namespace vfd

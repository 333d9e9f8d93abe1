#include "vfd/pipeline.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

namespace vfd{

const char* to_string(SheetStatus s){
    switch (s){
        case SheetStatus::Ok:               return "ok";
        case SheetStatus::InvalidSchema:    return "invalid schema";
        case SheetStatus::InsufficientData: return "insufficient data";
        case SheetStatus::Failed:           return "failed";
        default:                            return "unknown";
    }
}

std::vector<NormalizedSample> apply_time_window(const std::vector<NormalizedSample>& samples, TimeWindow w){
    if (samples.empty() || w == TimeWindow::All) return samples;

    const Timestamp latest = samples.back().t_us;
    const Timestamp span = (w == TimeWindow::Last24h) ? kUsPerDay : 7 * kUsPerDay;
    const Timestamp start = latest - span;

    //sorted, so the kept part is a suffix
    auto first = std::lower_bound(samples.begin(), samples.end(), start,
                                  [](const NormalizedSample& s, Timestamp t){ return s.t_us < t; });
    return std::vector<NormalizedSample>(first, samples.end());
}

std::vector<NormalizedSample> tail_rows(const std::vector<NormalizedSample>& samples, size_t max_rows){
    if (max_rows == 0 || samples.size() <= max_rows) return samples;
    return std::vector<NormalizedSample>(samples.end() - static_cast<std::ptrdiff_t>(max_rows), samples.end());
}

TimeDiagnoses diagnose_time_domain(const std::vector<NormalizedSample>& samples,
                                   StatMode mode, double sample_rate_hz){
    RollingStatEngine engine(mode, sample_rate_hz);
    const std::vector<AxisStats> stats = engine.compute(samples);

    TimeDiagnoses out;
    out.reserve(samples.size());
    for (size_t i = 0; i < samples.size(); ++i){
        std::optional<LabelSet> labels = (mode == StatMode::Rms)
            ? classify_rms(stats[i])
            : classify_std(samples[i], stats[i]);
        if (!labels) continue;      //window still filling, no diagnosis yet

        TimeDiagnosis d{};
        d.t_us = samples[i].t_us;
        d.labels = *labels;
        out.push_back(d);
    }
    return out;
}

SpectralDiagnoses diagnose_spectral(const std::vector<NormalizedSample>& samples,
                                    double rpm, double sample_rate_hz,
                                    const SpectralConfig& cfg){
    SpectralAnalyzer analyzer(cfg);
    SpectralResult res = analyzer.analyze(samples, rpm, sample_rate_hz);

    SpectralDiagnoses out;
    if (!res.valid) return out;
    for (AxisSpectrum& as : res.axes){
        SpectralDiagnosis d{};
        d.axis = as.axis;
        d.peak_frequency_hz = as.peak.frequency_hz;
        d.peak_amplitude = as.peak.amplitude;
        d.label = as.label;
        d.spectrum = std::move(as.spectrum);
        out.push_back(std::move(d));
    }
    return out;
}

SheetReport run_sheet(const RawSheet& sheet, const AnalysisConfig& cfg){
    SheetReport out{};
    out.sheet = sheet.name;
    if (cfg.mode == DiagnosisMode::Spectral) out.diagnoses = SpectralDiagnoses{};
    else                                     out.diagnoses = TimeDiagnoses{};

    // 1) column contract + axis roles
    AxisNormalizer normalizer(cfg.norm);
    NormalizeResult norm = normalizer.normalize(sheet);
    if (!norm.ok()){
        out.status = SheetStatus::InvalidSchema;
        out.missing_columns = norm.missing_columns;
        out.detail = "missing columns:";
        for (const std::string& c : norm.missing_columns) out.detail += " " + c;
        return out;
    }
    out.rows_total = norm.samples.size();

    // 2) sample rate from the whole sheet, before any windowing
    out.sample_rate_hz = estimate_sample_rate(norm.samples, cfg.rate_method);

    // 3) bound the work: time window first, then the row cap
    const std::vector<NormalizedSample> window = tail_rows(apply_time_window(norm.samples, cfg.window), cfg.max_rows);
    out.rows_used = window.size();

    if (window.size() < 2){
        out.status = SheetStatus::InsufficientData;
        out.detail = "fewer than 2 valid samples";
        return out;
    }
    //rms falls back to a 1 sample window when the rate is 0, the spectrum has no frequency axis without it
    if (cfg.mode == DiagnosisMode::Spectral && out.sample_rate_hz <= 0.0){
        out.status = SheetStatus::InsufficientData;
        out.detail = "sample rate could not be determined";
        return out;
    }

    // 4) diagnosis
    switch (cfg.mode){
        case DiagnosisMode::RollingRms:
            out.diagnoses = diagnose_time_domain(window, StatMode::Rms, out.sample_rate_hz);
            break;
        case DiagnosisMode::RollingStd:
            out.diagnoses = diagnose_time_domain(window, StatMode::StdDev, out.sample_rate_hz);
            break;
        case DiagnosisMode::Spectral:
            out.diagnoses = diagnose_spectral(window, cfg.rpm, out.sample_rate_hz, cfg.spectral);
            break;
    }
    out.status = SheetStatus::Ok;
    return out;
}

TimeDiagnoses fault_rows(const SheetReport& r){
    TimeDiagnoses out;
    const TimeDiagnoses* all = std::get_if<TimeDiagnoses>(&r.diagnoses);
    if (!all) return out;
    for (const TimeDiagnosis& d : *all){
        if (!d.normal()) out.push_back(d);
    }
    return out;
}

TimeDiagnoses last_faults(const SheetReport& r, size_t k){
    TimeDiagnoses faults = fault_rows(r);
    if (faults.size() > k) faults.erase(faults.begin(), faults.end() - static_cast<std::ptrdiff_t>(k));
    return faults;
}

} // namespace vfd

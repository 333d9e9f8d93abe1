#include "vfd/report.hpp"
#include "vfd/timestamp.hpp"
#include <algorithm>
#include <utility>
#include <variant>

namespace vfd{

std::vector<SummaryRow> summary_rows(const BatchSummary& b, size_t last_n){
    std::vector<SummaryRow> out;
    for (const SheetReport& r : b.entries){
        if (r.spectral()) continue;
        const TimeDiagnoses faults = (last_n > 0) ? last_faults(r, last_n) : fault_rows(r);
        for (const TimeDiagnosis& d : faults){
            SummaryRow row{};
            row.sheet = r.sheet;
            row.timestamp = format_timestamp(d.t_us);
            row.issue = d.text();
            out.push_back(std::move(row));
        }
    }
    return out;
}

std::vector<SpectralRow> spectral_rows(const BatchSummary& b){
    std::vector<SpectralRow> out;
    for (const SheetReport& r : b.entries){
        const SpectralDiagnoses* sd = std::get_if<SpectralDiagnoses>(&r.diagnoses);
        if (!sd) continue;
        for (const SpectralDiagnosis& d : *sd){
            SpectralRow row{};
            row.sheet = r.sheet;
            row.axis = axis_name(d.axis);
            row.peak_hz = d.peak_frequency_hz;
            row.peak_rpm = d.peak_rpm();
            row.amplitude = d.peak_amplitude;
            row.label = to_string(d.label);
            out.push_back(std::move(row));
        }
    }
    return out;
}

size_t write_summary(std::FILE* out, const BatchSummary& b, size_t last_n){
    if (!out) return 0;
    size_t lines = 0;

    const std::vector<SummaryRow> rows = summary_rows(b, last_n);
    if (!rows.empty()){
        size_t w_sheet = 11;    //"Asset Sheet"
        for (const SummaryRow& r : rows) w_sheet = std::max(w_sheet, r.sheet.size());

        std::fprintf(out, "%-*s  %-19s  %s\n", int(w_sheet), "Asset Sheet", "Timestamp", "Issue Detected");
        for (const SummaryRow& r : rows){
            std::fprintf(out, "%-*s  %-19s  %s\n", int(w_sheet), r.sheet.c_str(), r.timestamp.c_str(), r.issue.c_str());
            ++lines;
        }
    }

    const std::vector<SpectralRow> srows = spectral_rows(b);
    if (!srows.empty()){
        size_t w_sheet = 11;
        for (const SpectralRow& r : srows) w_sheet = std::max(w_sheet, r.sheet.size());

        std::fprintf(out, "%-*s  %-4s  %10s  %10s  %10s  %s\n", int(w_sheet), "Asset Sheet",
                     "Axis", "Peak Hz", "Peak RPM", "Amplitude", "Diagnosis");
        for (const SpectralRow& r : srows){
            std::fprintf(out, "%-*s  %-4c  %10.2f  %10.1f  %10.4f  %s\n", int(w_sheet), r.sheet.c_str(),
                         r.axis, r.peak_hz, r.peak_rpm, r.amplitude, r.label.c_str());
            ++lines;
        }
    }
    return lines;
}

} // namespace vfd

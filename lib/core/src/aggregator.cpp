#include "vfd/aggregator.hpp"
#include <exception>
#include <utility>

namespace vfd{

size_t BatchSummary::fault_count() const {
    size_t n = 0;
    for (const SheetReport& r : entries) n += fault_rows(r).size();
    return n;
}

DiagnosisAggregator::DiagnosisAggregator(const AnalysisConfig& cfg) : cfg_(cfg) {}

void DiagnosisAggregator::reset(){
    summary_ = BatchSummary{};
}

void DiagnosisAggregator::add(SheetReport report){
    //insufficient data still counts as a processed sheet, just with nothing in it
    if (report.status == SheetStatus::Ok || report.status == SheetStatus::InsufficientData){
        summary_.entries.push_back(std::move(report));
        return;
    }
    SkippedSheet s{};
    s.sheet = report.sheet;
    s.status = report.status;
    s.reason = report.detail;
    summary_.skipped.push_back(std::move(s));
}

SheetStatus DiagnosisAggregator::add_sheet(const RawSheet& sheet){
    SheetReport report;
    try {
        report = run_sheet(sheet, cfg_);
    } catch (const std::exception& e) {
        //one sheet going wrong must not take the rest of the workbook with it
        report = SheetReport{};
        report.sheet = sheet.name;
        report.status = SheetStatus::Failed;
        report.detail = e.what();
    }
    const SheetStatus status = report.status;
    add(std::move(report));
    return status;
}

BatchSummary DiagnosisAggregator::run_workbook(const std::vector<RawSheet>& sheets, const ProgressFn& progress){
    reset();
    const size_t total = sheets.size();
    for (size_t i = 0; i < total; ++i){
        add_sheet(sheets[i]);
        if (progress) progress(i + 1, total, sheets[i].name);
    }
    return summary_;
}

} // namespace vfd

#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "vfd/types.hpp"
#include "vfd/pipeline.hpp"

namespace vfd{

struct SkippedSheet {
    std::string sheet;
    SheetStatus status = SheetStatus::Failed;
    std::string reason;
};

// result of one run, single sheet or whole workbook
struct BatchSummary {
    std::vector<SheetReport> entries;       //processed sheets, input order
    std::vector<SkippedSheet> skipped;      //schema errors and failures, left out of entries

    size_t fault_count() const;             //time-domain rows with at least one label
};

// called after each sheet: 1-based index, sheet count, sheet name
using ProgressFn = std::function<void(size_t, size_t, const std::string&)>;

// collects sheet reports. a bad sheet never stops the batch
class DiagnosisAggregator {
public:
    explicit DiagnosisAggregator(const AnalysisConfig& cfg);

    void reset();

    // runs one sheet and files the report (entries or skipped). returns the status
    SheetStatus add_sheet(const RawSheet& sheet);

    // files an already computed report
    void add(SheetReport report);

    // sheets run in order, progress after each one
    BatchSummary run_workbook(const std::vector<RawSheet>& sheets, const ProgressFn& progress = ProgressFn{});

    const BatchSummary& summary() const {return summary_;}
    const AnalysisConfig& config() const {return cfg_;}

private:
    AnalysisConfig cfg_;        //copy, fixed for the life of the aggregator
    BatchSummary summary_;
};

} // namespace vfd

/*
 * main.cpp
 *
 * command line front end: builds the analysis config from flags, loads the
 * sheets and prints the diagnosis tables
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>
#include "cli_args.hpp"
#include "csv_sheet.hpp"
#include "vfd/aggregator.hpp"
#include "vfd/report.hpp"

namespace {

constexpr size_t kDefaultBatchRows = 500;   //per sheet cap when more than one sheet is given
constexpr size_t kShownFaults = 50;

void usage(const char* prog){
    std::fprintf(stderr,
        "usage: %s [options] <sheet.csv|dir> [...]\n"
        "  --mode rms|std|fft        diagnosis mode (default rms)\n"
        "  --axial x|y|z             raw axis aligned with the shaft (default z)\n"
        "  --rpm N                   shaft speed, spectral mode (default 1800)\n"
        "  --orientation TEXT        informational tag\n"
        "  --window all|24h|7d       time window anchored at the newest sample (default all)\n"
        "  --max-rows N              keep the most recent N rows per sheet\n"
        "  --layout per-axis|shared  t(x),x,t(y),y,t(z),z or one time column (default per-axis)\n"
        "  --time-col NAME           time column for --layout shared (default t)\n"
        "  --rate-method median|mean|first\n"
        "  --skip-dc                 leave bin 0 out of the spectral peak search\n"
        "  --all                     print every fault row, not only the newest %zu\n",
        prog, kShownFaults);
}

} // namespace

int main(int argc, char** argv){
    vfd::AnalysisConfig cfg{};
    bool rows_given = false;
    bool show_all = false;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i){
        const std::string a = argv[i];
        auto value = [&](const char*& v) -> bool {
            if (i + 1 >= argc) return false;
            v = argv[++i];
            return true;
        };
        const char* v = nullptr;
        bool ok = true;

        if (a == "-h" || a == "--help") {usage(argv[0]); return 0;}
        else if (a == "--mode"){
            ok = value(v);
            if (ok && std::strcmp(v, "rms") == 0)      cfg.mode = vfd::DiagnosisMode::RollingRms;
            else if (ok && std::strcmp(v, "std") == 0) cfg.mode = vfd::DiagnosisMode::RollingStd;
            else if (ok && std::strcmp(v, "fft") == 0) cfg.mode = vfd::DiagnosisMode::Spectral;
            else ok = false;
        }
        else if (a == "--axial")       ok = value(v) && vfd_app::parse_axis(v, cfg.norm.axial);
        else if (a == "--rpm")         ok = value(v) && vfd_app::parse_double(v, cfg.rpm) && cfg.rpm > 0.0;
        else if (a == "--orientation") {ok = value(v); if (ok) cfg.orientation = v;}
        else if (a == "--window"){
            ok = value(v);
            if (ok && std::strcmp(v, "all") == 0)      cfg.window = vfd::TimeWindow::All;
            else if (ok && std::strcmp(v, "24h") == 0) cfg.window = vfd::TimeWindow::Last24h;
            else if (ok && std::strcmp(v, "7d") == 0)  cfg.window = vfd::TimeWindow::Last7d;
            else ok = false;
        }
        else if (a == "--max-rows")    {ok = value(v) && vfd_app::parse_size(v, cfg.max_rows); rows_given = ok;}
        else if (a == "--layout"){
            ok = value(v);
            if (ok && std::strcmp(v, "per-axis") == 0)    cfg.norm.layout = vfd::SchemaLayout::PerAxisTime;
            else if (ok && std::strcmp(v, "shared") == 0) cfg.norm.layout = vfd::SchemaLayout::SharedTime;
            else ok = false;
        }
        else if (a == "--time-col")    {ok = value(v); if (ok) cfg.norm.time_column = v;}
        else if (a == "--rate-method"){
            ok = value(v);
            if (ok && std::strcmp(v, "median") == 0)     cfg.rate_method = vfd::RateMethod::Median;
            else if (ok && std::strcmp(v, "mean") == 0)  cfg.rate_method = vfd::RateMethod::Mean;
            else if (ok && std::strcmp(v, "first") == 0) cfg.rate_method = vfd::RateMethod::FirstInterval;
            else ok = false;
        }
        else if (a == "--skip-dc")     cfg.spectral.skip_dc_bin = true;
        else if (a == "--all")         show_all = true;
        else if (!a.empty() && a[0] == '-') ok = false;
        else inputs.push_back(a);

        if (!ok){
            std::fprintf(stderr, "bad option: %s\n", a.c_str());
            usage(argv[0]);
            return 2;
        }
    }

    const std::vector<std::string> paths = vfd_app::collect_sheet_paths(inputs);
    if (paths.empty()){
        usage(argv[0]);
        return 2;
    }

    const bool batch = paths.size() > 1;
    if (batch && !rows_given) cfg.max_rows = kDefaultBatchRows;

    vfd::DiagnosisAggregator agg(cfg);
    const size_t total = paths.size();
    for (size_t i = 0; i < total; ++i){
        vfd::RawSheet sheet;
        std::string err;
        if (!vfd_app::load_csv_sheet(paths[i], sheet, err)){
            vfd::SheetReport r{};
            r.sheet = paths[i];
            r.status = vfd::SheetStatus::Failed;
            r.detail = err;
            agg.add(std::move(r));
        } else {
            agg.add_sheet(sheet);
        }
        if (batch) std::printf("Processed %zu/%zu sheets\n", i + 1, total);
    }

    const vfd::BatchSummary& summary = agg.summary();
    for (const vfd::SkippedSheet& s : summary.skipped)
        std::fprintf(stderr, "skipped %s: %s (%s)\n", s.sheet.c_str(), vfd::to_string(s.status), s.reason.c_str());

    for (const vfd::SheetReport& r : summary.entries){
        std::printf("Sheet %s: estimated sample rate ~ %.2f Hz, data points selected: %zu\n",
                    r.sheet.c_str(), r.sample_rate_hz, r.rows_used);
        if (r.status != vfd::SheetStatus::Ok)
            std::printf("  no diagnosis possible: %s\n", r.detail.c_str());
    }

    std::printf("\n");
    const size_t lines = vfd::write_summary(stdout, summary, show_all ? 0 : kShownFaults);
    if (lines == 0) std::printf("No issues detected in any sheet.\n");
    return 0;
}

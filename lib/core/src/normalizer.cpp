#include "vfd/normalizer.hpp"
#include "vfd/timestamp.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>

namespace vfd{

AxisNormalizer::AxisNormalizer(const NormalizeConfig& cfg) : cfg_(cfg) {}

std::string AxisNormalizer::lower_(const std::string& s){
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> AxisNormalizer::required_columns() const {
    if (cfg_.layout == SchemaLayout::SharedTime)
        return {lower_(cfg_.time_column), "x", "y", "z"};
    return {"t(x)", "x", "t(y)", "y", "t(z)", "z"};
}

NormalizeResult AxisNormalizer::normalize(const RawSheet& sheet) const {
    NormalizeResult out{};

    //case-insensitive lookup, first occurrence of a label wins
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < sheet.columns.size(); ++i)
        index.emplace(lower_(sheet.columns[i]), i);

    for (const std::string& col : required_columns()){
        if (index.find(col) == index.end()) out.missing_columns.push_back(col);
    }
    if (!out.missing_columns.empty()){
        out.status = NormalizeStatus::InvalidSchema;
        return out;
    }

    //radials keep their x,y,z order once the axial one is taken out
    const AxisId all[3] = {AxisId::X, AxisId::Y, AxisId::Z};
    AxisId radial[2] = {AxisId::X, AxisId::Y};
    int r = 0;
    for (AxisId a : all){
        if (a != cfg_.axial) radial[r++] = a;
    }

    const std::string axial_label(1, axis_name(cfg_.axial));
    const std::string time_label = (cfg_.layout == SchemaLayout::SharedTime)
        ? lower_(cfg_.time_column)
        : "t(" + axial_label + ")";

    const size_t col_t = index.at(time_label);
    const size_t col_z = index.at(axial_label);
    const size_t col_x = index.at(std::string(1, axis_name(radial[0])));
    const size_t col_y = index.at(std::string(1, axis_name(radial[1])));

    out.samples.reserve(sheet.rows.size());
    for (const RawRecord& row : sheet.rows){
        auto cell = [&row](size_t c) -> const Cell* {
            return (c < row.size()) ? &row[c] : nullptr;
        };
        const Cell* ct = cell(col_t);
        const Cell* cz = cell(col_z);
        const Cell* cx = cell(col_x);
        const Cell* cy = cell(col_y);

        //unparseable numbers count as nulls
        std::optional<double> z = cz ? cell_to_number(*cz) : std::nullopt;
        std::optional<double> x = cx ? cell_to_number(*cx) : std::nullopt;
        std::optional<double> y = cy ? cell_to_number(*cy) : std::nullopt;
        if (!ct || ct->kind == Cell::Kind::Null || !x || !y || !z){
            out.dropped_null++;
            continue;
        }

        std::optional<Timestamp> t = cell_to_timestamp(*ct);
        if (!t){
            out.dropped_bad_time++;
            continue;
        }

        NormalizedSample s{};
        s.t_us = *t;
        s.x = *x;
        s.y = *y;
        s.z = *z;
        out.samples.push_back(s);
    }

    //stable so duplicate timestamps keep their source order
    std::stable_sort(out.samples.begin(), out.samples.end(),
                     [](const NormalizedSample& a, const NormalizedSample& b){ return a.t_us < b.t_us; });
    return out;
}

} // namespace vfd

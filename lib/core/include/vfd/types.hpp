#pragma once            // includes this header only once per compilation
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vfd{          // vibration fault diagnosis

// timestamps are UTC microseconds since the unix epoch
using Timestamp = int64_t;

constexpr Timestamp kUsPerSecond = 1000000;
constexpr Timestamp kUsPerDay = 86400LL * kUsPerSecond;

enum class AxisId : uint8_t {
    X = 0,
    Y = 1,
    Z = 2
};

// one cell of a source table, the ingestion layer decides the kind
struct Cell {
    enum class Kind : uint8_t {Null, Number, Text, Time} kind = Kind::Null;
    double num = 0.0;
    Timestamp t_us = 0;
    std::string text;

    static Cell null() {return Cell{};}
    static Cell number(double v) {Cell c; c.kind = Kind::Number; c.num = v; return c;}
    static Cell time(Timestamp t) {Cell c; c.kind = Kind::Time; c.t_us = t; return c;}
    static Cell str(std::string s) {Cell c; c.kind = Kind::Text; c.text = std::move(s); return c;}
};

// one source row, aligned with RawSheet::columns
using RawRecord = std::vector<Cell>;

// one asset sheet as handed over by the ingestion layer
struct RawSheet {
    std::string name;
    std::vector<std::string> columns;   //labels as written, matched case-insensitively
    std::vector<RawRecord> rows;
};

// canonical sample, z is always the axial channel
struct NormalizedSample {
    Timestamp t_us = 0;
    double x = 0.0;     //radial
    double y = 0.0;     //radial
    double z = 0.0;     //axial
};

inline char axis_name(AxisId a){
    switch (a){
        case AxisId::X: return 'x';
        case AxisId::Y: return 'y';
        case AxisId::Z: return 'z';
        default:        return '?';
    }
}

inline double axis_value(const NormalizedSample& s, AxisId a){
    switch (a){
        case AxisId::X: return s.x;
        case AxisId::Y: return s.y;
        default:        return s.z;
    }
}

} // namespace vfd

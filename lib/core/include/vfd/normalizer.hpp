#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "vfd/types.hpp"

namespace vfd{

// which column contract a sheet follows
enum class SchemaLayout : uint8_t {
    PerAxisTime,    // t(x), x, t(y), y, t(z), z
    SharedTime      // <time_column>, x, y, z
};

struct NormalizeConfig {
    AxisId axial = AxisId::Z;               //raw column that ends up under z
    SchemaLayout layout = SchemaLayout::PerAxisTime;
    std::string time_column = "t";          //only read for SharedTime
};

enum class NormalizeStatus : uint8_t {
    Ok = 0,
    InvalidSchema = 1
};

struct NormalizeResult {
    NormalizeStatus status = NormalizeStatus::Ok;
    std::vector<std::string> missing_columns;   //filled when InvalidSchema
    std::vector<NormalizedSample> samples;      //ascending by t, duplicates kept
    size_t dropped_null = 0;                    //rows with a null value in a selected column
    size_t dropped_bad_time = 0;                //rows whose timestamp would not parse

    bool ok() const {return status == NormalizeStatus::Ok;}
};

// maps a raw sheet onto the canonical {t, x, y, z} schema
class AxisNormalizer {
public:
    explicit AxisNormalizer(const NormalizeConfig& cfg);

    NormalizeResult normalize(const RawSheet& sheet) const;

    // required column labels (lower case) for the configured layout
    std::vector<std::string> required_columns() const;

private:
    NormalizeConfig cfg_;

    static std::string lower_(const std::string& s);
};

} // namespace vfd

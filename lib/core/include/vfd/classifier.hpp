#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "vfd/types.hpp"
#include "vfd/rolling.hpp"

namespace vfd{

// fixed thresholds, raw engineering units of the input (no unit conversion)
constexpr double kRadialLimit = 0.5;        //x or y
constexpr double kAxialLimit = 0.35;        //z
constexpr double kImbalanceLimit = 0.2;     //|x - y|, RMS mode
constexpr double kStdLimit = 0.05;          //any axis, std-dev mode

constexpr const char* kNormalLabel = "Normal";

// enum order is the report order
enum class FaultLabel : uint8_t {
    RadialHigh = 0,
    AxialHigh = 1,
    Looseness = 2,
    LoosenessOrVariableLoad = 3
};

const char* to_string(FaultLabel l);

// small ordered set, iteration always follows FaultLabel order
class LabelSet {
public:
    void add(FaultLabel l) {bits_ |= uint8_t(1u << uint8_t(l));}
    bool has(FaultLabel l) const {return (bits_ >> uint8_t(l)) & 1u;}
    bool empty() const {return bits_ == 0;}
    size_t size() const;
    std::vector<FaultLabel> labels() const;

    // "Radial High, Looseness", or "Normal" when empty
    std::string text() const;

    bool operator==(const LabelSet& o) const {return bits_ == o.bits_;}
    bool operator!=(const LabelSet& o) const {return bits_ != o.bits_;}

private:
    uint8_t bits_ = 0;
};

// RMS rules, every rule is checked, comparisons are strict
LabelSet classify_rms(double x_rms, double y_rms, double z_rms);

// nullopt when any axis statistic is missing
std::optional<LabelSet> classify_rms(const AxisStats& rms);

// std-dev rules: raw values against the radial/axial limits, any std-dev above kStdLimit
// flags looseness or variable load. nullopt while the std-dev window is still filling
std::optional<LabelSet> classify_std(const NormalizedSample& raw, const AxisStats& std_dev);

} // namespace vfd

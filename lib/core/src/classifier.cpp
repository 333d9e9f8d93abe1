#include "vfd/classifier.hpp"
#include <cmath>

namespace vfd{

const char* to_string(FaultLabel l){
    switch (l){
        case FaultLabel::RadialHigh:              return "Radial High";
        case FaultLabel::AxialHigh:               return "Axial High";
        case FaultLabel::Looseness:               return "Looseness";
        case FaultLabel::LoosenessOrVariableLoad: return "Looseness or Variable Load";
        default:                                  return "Unknown";
    }
}

size_t LabelSet::size() const {
    size_t n = 0;
    for (uint8_t b = bits_; b; b &= uint8_t(b - 1)) ++n;
    return n;
}

std::vector<FaultLabel> LabelSet::labels() const {
    std::vector<FaultLabel> out;
    for (uint8_t i = 0; i < 8; ++i){
        if ((bits_ >> i) & 1u) out.push_back(static_cast<FaultLabel>(i));
    }
    return out;
}

std::string LabelSet::text() const {
    if (empty()) return kNormalLabel;
    std::string out;
    for (FaultLabel l : labels()){
        if (!out.empty()) out += ", ";
        out += to_string(l);
    }
    return out;
}

LabelSet classify_rms(double x_rms, double y_rms, double z_rms){
    LabelSet out;
    if (x_rms > kRadialLimit || y_rms > kRadialLimit)   //radial
        out.add(FaultLabel::RadialHigh);
    if (z_rms > kAxialLimit)                            //axial
        out.add(FaultLabel::AxialHigh);
    if (std::fabs(x_rms - y_rms) > kImbalanceLimit)     //radial imbalance
        out.add(FaultLabel::Looseness);
    return out;
}

std::optional<LabelSet> classify_rms(const AxisStats& rms){
    if (!rms.complete()) return std::nullopt;
    return classify_rms(*rms.x, *rms.y, *rms.z);
}

std::optional<LabelSet> classify_std(const NormalizedSample& raw, const AxisStats& std_dev){
    if (!std_dev.complete()) return std::nullopt;

    LabelSet out;
    if (raw.x > kRadialLimit || raw.y > kRadialLimit)
        out.add(FaultLabel::RadialHigh);
    if (raw.z > kAxialLimit)
        out.add(FaultLabel::AxialHigh);
    if (*std_dev.x > kStdLimit || *std_dev.y > kStdLimit || *std_dev.z > kStdLimit)
        out.add(FaultLabel::LoosenessOrVariableLoad);
    return out;
}

} // namespace vfd

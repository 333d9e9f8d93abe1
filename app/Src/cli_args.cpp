#include "cli_args.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace vfd_app {

bool parse_axis(const char* s, vfd::AxisId& out){
    if (std::strcmp(s, "x") == 0 || std::strcmp(s, "X") == 0) {out = vfd::AxisId::X; return true;}
    if (std::strcmp(s, "y") == 0 || std::strcmp(s, "Y") == 0) {out = vfd::AxisId::Y; return true;}
    if (std::strcmp(s, "z") == 0 || std::strcmp(s, "Z") == 0) {out = vfd::AxisId::Z; return true;}
    return false;
}

bool parse_size(const char* s, size_t& out){
    //strtoull would wrap "-5" around to a huge count
    if (!std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE) return false;
    out = static_cast<size_t>(v);
    return true;
}

bool parse_double(const char* s, double& out){
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

} // namespace vfd_app

#include "SpatialMask.h"
#include <algorithm>
#include <cmath>
#include <array>
#include <sstream>
#include "../config/ConfigError.h"

namespace {

// name          family             z1  z2  z3  z4  z5
const std::array<spatialMask_S, 6> mask_table = {{
    {"P1_W",  MaskFamily_NonTGI, {{+1, +1,  0,  0,  0}}},
    {"P1_C",  MaskFamily_NonTGI, {{-1, -1,  0,  0,  0}}},
    {"P3_W",  MaskFamily_NonTGI, {{ 0,  0, +1, +1,  0}}},
    {"P3_C",  MaskFamily_NonTGI, {{ 0,  0, -1, -1,  0}}},
    {"TGI_1", MaskFamily_TGI,    {{+1, -1, +1, -1,  0}}},
    {"TGI_2", MaskFamily_TGI,    {{-1, +1, -1, +1,  0}}},
}};

} // namespace

const spatialMask_S& masks::find_mask(const std::string& name) {
    for (const auto& m : mask_table) {
        if (m.name == name) {
            return m;
        }
    }
    std::ostringstream oss;
    oss << "unknown mask '" << name << "', expected one of:";
    for (const auto& m : mask_table) {
        oss << " " << m.name;
    }
    throw config_error(oss.str());
}

bool masks::is_known_mask(const std::string& name) {
    return std::any_of(mask_table.begin(), mask_table.end(),
                       [&name](const spatialMask_S& m) { return m.name == name; });
}

std::vector<std::string> masks::mask_names() {
    std::vector<std::string> names;
    names.reserve(mask_table.size());
    for (const auto& m : mask_table) {
        names.push_back(m.name);
    }
    return names;
}

zoneTemps_T masks::apply_mask(const spatialMask_S& mask, double delta,
                              double baseline, double temp_min, double temp_max) {
    if (!std::isfinite(baseline) || !std::isfinite(temp_min) || !std::isfinite(temp_max) || temp_min > temp_max) {
        throw config_error("apply_mask: baseline/bounds must be finite with temp_min <= temp_max");
    }
    zoneTemps_T temps{};
    for (std::size_t z = 0; z < mask.polarity.size(); ++z) {
        double raw = baseline + static_cast<double>(mask.polarity[z]) * delta;
        if (!std::isfinite(raw)) {
            raw = baseline; // NaN would pass straight through std::clamp
        }
        temps[z] = std::clamp(raw, temp_min, temp_max);
    }
    return temps;
}

spatialMask_S masks::negated_mask(const spatialMask_S& mask) {
    spatialMask_S out = mask;
    out.name = "-" + mask.name;
    for (auto& p : out.polarity) {
        p = -p;
    }
    return out;
}

std::vector<std::size_t> masks::active_zones(const spatialMask_S& mask) {
    std::vector<std::size_t> zones;
    for (std::size_t z = 0; z < mask.polarity.size(); ++z) {
        if (mask.polarity[z] != 0) {
            zones.push_back(z);
        }
    }
    return zones;
}

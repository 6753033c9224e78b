/*
==============================================================================
	File: SpatialMask.h
	Desc: Named per-zone polarity patterns and the clamp that turns
	(baseline, delta, mask) into commanded zone temperatures.
	Masks are data: adding one means adding a row to the table in
	SpatialMask.cpp, nothing else iterates over mask identities.
==============================================================================
*/

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "../utils/Types.h"

struct spatialMask_S {
	std::string name;
	MaskFamily_E family = MaskFamily_NonTGI;
	zonePolarity_T polarity{}; // +1 warm with delta, -1 mirrored, 0 held at baseline
}; // spatialMask_S

namespace masks {

// throws config_error for unknown names
const spatialMask_S& find_mask(const std::string& name);

bool is_known_mask(const std::string& name);

std::vector<std::string> mask_names();

// clamp(baseline + polarity[z] * delta, temp_min, temp_max) for every zone;
// a non-finite delta commands the baseline, non-finite bounds throw config_error
zoneTemps_T apply_mask(const spatialMask_S& mask, double delta,
                       double baseline, double temp_min, double temp_max);

// same mask with every polarity flipped
spatialMask_S negated_mask(const spatialMask_S& mask);

// indices of zones with non-zero polarity
std::vector<std::size_t> active_zones(const spatialMask_S& mask);

} // namespace masks

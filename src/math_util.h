#pragma once

#include <string>

#include <boost/optional.hpp>

namespace floorscan {

constexpr double pi = 3.14159265359;

constexpr double deg_to_rad(double deg) {
	return deg * (pi / 180.0);
}

// Wrap heading (degrees) into [0, 360).
// Returns none for non-finite input.
boost::optional<float> normalizeHeading(float heading_deg);

// 8-point compass label ("N", "NE", ... "NW") of a heading in degrees.
std::string compassDirection(float heading_deg);

}  // namespace

#include "math_util.h"

#include <array>
#include <cmath>

namespace floorscan {

boost::optional<float> normalizeHeading(float heading_deg) {
	if(!std::isfinite(heading_deg)) {
		return boost::none;
	}
	float wrapped = std::fmod(heading_deg, 360.0f);
	if(wrapped < 0) {
		wrapped += 360.0f;
	}
	// fmod of tiny negative values can round up to exactly 360.
	if(wrapped >= 360.0f) {
		wrapped = 0;
	}
	return wrapped;
}

std::string compassDirection(float heading_deg) {
	static const std::array<const char*, 8> directions = {
		"N", "NE", "E", "SE", "S", "SW", "W", "NW"};
	const auto heading = normalizeHeading(heading_deg);
	if(!heading) {
		return "";
	}
	const int index = static_cast<int>((*heading + 22.5f) / 45.0f) % 8;
	return directions[index];
}

}  // namespace

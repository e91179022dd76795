#include "drawable.h"

#include <stdexcept>

namespace floorscan {

Color Color::withAlpha(float alpha) const {
	return Color{r, g, b, alpha};
}

std::string layerName(Layer layer) {
	switch(layer) {
	case Layer::Grid: return "grid";
	case Layer::Compass: return "compass";
	case Layer::Trail: return "trail";
	case Layer::Wall: return "wall";
	case Layer::WallCorner: return "wall_corner";
	case Layer::Door: return "door";
	case Layer::Window: return "window";
	case Layer::Object: return "object";
	case Layer::Device: return "device";
	case Layer::DeviceFov: return "device_fov";
	}
	throw std::invalid_argument("Unknown layer");
}

int layerRank(Layer layer) {
	switch(layer) {
	case Layer::Grid:
	case Layer::Compass:
		return 0;
	case Layer::Trail:
		return 1;
	case Layer::Wall:
	case Layer::WallCorner:
		return 2;
	case Layer::Door:
		return 3;
	case Layer::Window:
		return 4;
	case Layer::Object:
		return 5;
	case Layer::Device:
	case Layer::DeviceFov:
		return 6;
	}
	throw std::invalid_argument("Unknown layer");
}

}  // namespace

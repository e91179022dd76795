#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <Eigen/Dense>

namespace floorscan {

// Straight (non-premultiplied) RGBA, each in [0, 1].
struct Color {
	float r;
	float g;
	float b;
	float a;

	Color withAlpha(float alpha) const;
};

struct Style {
	boost::optional<Color> fill;
	boost::optional<Color> stroke;
	float stroke_width = 1;
	// Alternating on/off lengths in px. Empty means solid.
	std::vector<float> dash;
};

enum class DrawableKind {
	// Open path through points.
	Polyline,
	// Closed path through points.
	Polygon,
	// points[0] is the center.
	Circle
};

// What a drawable depicts. Determines its place in the draw order.
enum class Layer {
	Grid,
	Compass,
	Trail,
	Wall,
	WallCorner,
	Door,
	Window,
	Object,
	Device,
	DeviceFov
};

std::string layerName(Layer layer);

// Back-to-front rank of a layer. Layers of one element (e.g. a wall
// and its corner markers) share a rank.
int layerRank(Layer layer);

// A 2D primitive in canvas pixels.
struct Drawable {
	DrawableKind kind;
	Layer layer;
	std::vector<Eigen::Vector2f> points;
	float radius;
	Style style;
};

}  // namespace

#include "scene_projector.h"

#include <cmath>

#include <geom/transform_decomposer.h>
#include <logging.h>
#include <math_util.h>

namespace floorscan {

namespace {

const Color white = {1, 1, 1, 1};
const Color red = {1, 0, 0, 1};
const Color green = {0, 0.8f, 0, 1};
const Color yellow = {1, 0.9f, 0, 1};
const Color blue = {0, 0.4f, 1, 1};
const Color brown = {0.6f, 0.4f, 0.2f, 1};
const Color cyan = {0, 0.85f, 0.95f, 1};
const Color orange = {1, 0.6f, 0, 1};

const float wall_line_width_px = 6;
const float wall_corner_radius_px = 5;
const float opening_thickness_px = 6;
const float compass_center_y_px = 50;
const float compass_length_px = 30;
const float front_tick_factor = 1.3;

Style strokeStyle(const Color& color, float width) {
	Style style;
	style.stroke = color;
	style.stroke_width = width;
	return style;
}

Style fillStyle(const Color& color) {
	Style style;
	style.fill = color;
	return style;
}

Drawable makeLine(Layer layer, const Eigen::Vector2f& p0, const Eigen::Vector2f& p1, const Style& style) {
	return Drawable{DrawableKind::Polyline, layer, {p0, p1}, 0, style};
}

// Rotate by angle (radians) in canvas space, then translate to center.
Eigen::Vector2f placeLocal(const Eigen::Vector2f& center, float angle, float x, float y) {
	const float c = std::cos(angle);
	const float s = std::sin(angle);
	return center + Eigen::Vector2f(x * c - y * s, x * s + y * c);
}

}  // namespace

ProjectionOptions ProjectionOptions::full() {
	return ProjectionOptions();
}

ProjectionOptions ProjectionOptions::preview() {
	ProjectionOptions options;
	options.grid = false;
	options.compass = false;
	options.trail = false;
	options.device = false;
	return options;
}


SceneProjector::SceneProjector(const PlanConfig& config, const ProjectionOptions& options) :
	config(config), options(options) {
}

std::vector<Drawable> SceneProjector::project(
		const Snapshot* snapshot,
		const std::vector<Eigen::Vector3f>& trail,
		const ViewportState& viewport,
		const boost::optional<float>& heading,
		const boost::optional<RigidTransform>& device,
		const CanvasSize& canvas) const {
	std::vector<Drawable> drawables;
	if(options.grid) {
		projectGrid(drawables, viewport, canvas);
	}
	if(options.compass && heading) {
		projectCompass(drawables, *heading, canvas);
	}
	if(options.trail) {
		projectTrail(drawables, trail, viewport);
	}
	if(snapshot != nullptr) {
		projectWalls(drawables, *snapshot, viewport);
		projectOpenings(drawables, snapshot->getDoors(), viewport);
		projectOpenings(drawables, snapshot->getWindows(), viewport);
		projectObjects(drawables, *snapshot, viewport);
		if(options.device && device) {
			projectDevice(drawables, *device, viewport);
		}
	}
	return drawables;
}

void SceneProjector::projectGrid(std::vector<Drawable>& out,
		const ViewportState& viewport, const CanvasSize& canvas) const {
	const float scale = viewport.getScale();
	const Eigen::Vector2f origin = viewport.toCanvas(Eigen::Vector2f::Zero());
	if(!(scale > 0) || !std::isfinite(scale) || !origin.allFinite()) {
		WARN("Grid skipped for unusable viewport", scale);
		return;
	}
	// 1m grid, coarsened until lines are at least grid_min_spacing_px apart.
	float step_px = scale;
	while(step_px < config.grid_min_spacing_px) {
		step_px *= 2;
	}
	const Style style = strokeStyle(white.withAlpha(0.1), 0.5);
	const float width = canvas.width;
	const float height = canvas.height;

	for(float x = origin.x() - std::floor(origin.x() / step_px) * step_px; x < width; x += step_px) {
		out.push_back(makeLine(Layer::Grid,
			Eigen::Vector2f(x, 0.0f), Eigen::Vector2f(x, height), style));
	}
	for(float y = origin.y() - std::floor(origin.y() / step_px) * step_px; y < height; y += step_px) {
		out.push_back(makeLine(Layer::Grid,
			Eigen::Vector2f(0.0f, y), Eigen::Vector2f(width, y), style));
	}
}

void SceneProjector::projectCompass(std::vector<Drawable>& out,
		float heading, const CanvasSize& canvas) const {
	// North indicator: rotates against the device heading.
	const float angle = -deg_to_rad(heading);
	const Eigen::Vector2f center(canvas.width / 2.0f, compass_center_y_px);
	const Eigen::Vector2f tip = center +
		compass_length_px * Eigen::Vector2f(std::sin(angle), -std::cos(angle));
	out.push_back(makeLine(Layer::Compass, center, tip, strokeStyle(red.withAlpha(0.6), 3)));
}

void SceneProjector::projectTrail(std::vector<Drawable>& out,
		const std::vector<Eigen::Vector3f>& trail, const ViewportState& viewport) const {
	if(trail.size() < 2) {
		return;
	}
	Drawable path{DrawableKind::Polyline, Layer::Trail, {}, 0,
		strokeStyle(blue.withAlpha(0.5), 2)};
	path.style.dash = {5, 3};
	for(const auto& pos : trail) {
		path.points.push_back(viewport.toCanvas(toPlane(pos)));
	}
	out.push_back(path);
}

void SceneProjector::projectWalls(std::vector<Drawable>& out,
		const Snapshot& snapshot, const ViewportState& viewport) const {
	for(const auto& wall : snapshot.getWalls()) {
		const auto ends = wallEndpoints(wall, config.epsilon);
		const Eigen::Vector2f p0 = viewport.toCanvas(ends.first);
		const Eigen::Vector2f p1 = viewport.toCanvas(ends.second);
		out.push_back(makeLine(Layer::Wall, p0, p1, strokeStyle(green, wall_line_width_px)));
		for(const auto& corner : {p0, p1}) {
			out.push_back(Drawable{DrawableKind::Circle, Layer::WallCorner,
				{corner}, wall_corner_radius_px, fillStyle(yellow)});
		}
	}
}

void SceneProjector::projectOpenings(std::vector<Drawable>& out,
		const std::vector<SurfaceElement>& openings, const ViewportState& viewport) const {
	for(const auto& opening : openings) {
		const bool is_window = opening.kind == SurfaceKind::Window;
		const Layer layer = is_window ? Layer::Window : Layer::Door;
		const Eigen::Vector2f center = viewport.toCanvas(toPlane(opening.transform.getPosition()));
		const float half_w = viewport.toPixels(opening.dimensions.x() / 2);
		const float half_t = opening_thickness_px / 2;

		const Color color = is_window ? cyan.withAlpha(0.6) : brown.withAlpha(0.8);
		out.push_back(Drawable{DrawableKind::Polygon, layer, {
				center + Eigen::Vector2f(-half_w, -half_t),
				center + Eigen::Vector2f(half_w, -half_t),
				center + Eigen::Vector2f(half_w, half_t),
				center + Eigen::Vector2f(-half_w, half_t)},
			0, fillStyle(color)});
		if(is_window) {
			out.push_back(makeLine(layer,
				center - Eigen::Vector2f(half_w, 0.0f), center + Eigen::Vector2f(half_w, 0.0f),
				strokeStyle(cyan, 1)));
		}
	}
}

void SceneProjector::projectObjects(std::vector<Drawable>& out,
		const Snapshot& snapshot, const ViewportState& viewport) const {
	for(const auto& object : snapshot.getObjects()) {
		const PlanarPose pose = decomposeByRight(object.transform, config.epsilon);
		const Eigen::Vector2f center = viewport.toCanvas(pose.position);
		const float half_w = viewport.toPixels(object.dimensions.x() / 2);
		const float half_d = viewport.toPixels(object.dimensions.z() / 2);

		Style body = fillStyle(orange.withAlpha(0.4));
		body.stroke = orange;
		body.stroke_width = 1.5;
		out.push_back(Drawable{DrawableKind::Polygon, Layer::Object, {
				placeLocal(center, pose.yaw, -half_w, -half_d),
				placeLocal(center, pose.yaw, half_w, -half_d),
				placeLocal(center, pose.yaw, half_w, half_d),
				placeLocal(center, pose.yaw, -half_w, half_d)},
			0, body});
		// Front tick along local -Y.
		out.push_back(makeLine(Layer::Object,
			center, placeLocal(center, pose.yaw, 0, -half_d * front_tick_factor),
			strokeStyle(orange, 2)));
	}
}

void SceneProjector::projectDevice(std::vector<Drawable>& out,
		const RigidTransform& device, const ViewportState& viewport) const {
	const PlanarPose pose = decomposeByForward(device, config.epsilon);
	const Eigen::Vector2f center = viewport.toCanvas(pose.position);
	// Canvas direction of forward; yaw = atan2(forward.x, forward.z).
	const Eigen::Vector2f dir(std::sin(pose.yaw), std::cos(pose.yaw));
	const Eigen::Vector2f side(dir.y(), -dir.x());
	const float size = config.device_glyph_size_px;

	Style glyph = fillStyle(red);
	glyph.stroke = white;
	glyph.stroke_width = 2;
	out.push_back(Drawable{DrawableKind::Polygon, Layer::Device, {
			center + dir * size,
			center - dir * (size * 0.5f) + side * (size * 0.7f),
			center - dir * (size * 0.5f) - side * (size * 0.7f)},
		0, glyph});

	const float half_angle = deg_to_rad(config.fov_half_angle_deg);
	const float length = config.fov_length_px;
	Style wedge = fillStyle(red.withAlpha(0.2));
	wedge.stroke = red.withAlpha(0.5);
	wedge.stroke_width = 1;
	out.push_back(Drawable{DrawableKind::Polygon, Layer::DeviceFov, {
			center,
			center + length * Eigen::Vector2f(
				std::sin(pose.yaw - half_angle), std::cos(pose.yaw - half_angle)),
			center + length * Eigen::Vector2f(
				std::sin(pose.yaw + half_angle), std::cos(pose.yaw + half_angle))},
		0, wedge});
}

}  // namespace

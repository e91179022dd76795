#include "scene_projector.h"

#include <cmath>
#include <map>

#include <boost/range/irange.hpp>
#include <gtest/gtest.h>

#include <geom/transform_decomposer.h>
#include <math_util.h>
#include <scan/toy_room.h>
#include <tracking/trail_recorder.h>

using floorscan::CanvasSize;
using floorscan::Drawable;
using floorscan::Layer;
using floorscan::PlanConfig;
using floorscan::ProjectionOptions;
using floorscan::SceneProjector;
using floorscan::ViewportState;

namespace {

const CanvasSize canvas = {800, 600};

std::map<Layer, int> countLayers(const std::vector<Drawable>& drawables) {
	std::map<Layer, int> counts;
	for(const auto& drawable : drawables) {
		counts[drawable.layer]++;
	}
	return counts;
}

std::vector<Eigen::Vector3f> shortTrail() {
	return {
		Eigen::Vector3f(0, 1, 0),
		Eigen::Vector3f(0.5, 1, 0.2),
		Eigen::Vector3f(1, 1, 0.5)};
}

}  // namespace

class SceneProjectorTest : public ::testing::Test {
protected:
	SceneProjectorTest() :
		room(floorscan::createToyRoom()),
		viewport(40, Eigen::Vector2f(400, 300), Eigen::Vector2f::Zero()) {
	}

	std::vector<Drawable> projectFull(
			const boost::optional<float>& heading, const ViewportState& vp) const {
		const SceneProjector projector(config, ProjectionOptions::full());
		return projector.project(room.get(), shortTrail(), vp, heading,
			floorscan::estimateDeviceTransform(*room), canvas);
	}

	PlanConfig config;
	floorscan::SnapshotPtr room;
	ViewportState viewport;
};

TEST_F(SceneProjectorTest, LayersAreBackToFront) {
	const auto drawables = projectFull(90.0f, viewport);
	ASSERT_FALSE(drawables.empty());
	for(const int i : boost::irange<int>(1, drawables.size())) {
		EXPECT_LE(floorscan::layerRank(drawables[i - 1].layer), floorscan::layerRank(drawables[i].layer))
			<< "at " << i << ": " << floorscan::layerName(drawables[i].layer);
	}
	EXPECT_EQ(Layer::Grid, drawables.front().layer);
	EXPECT_EQ(Layer::DeviceFov, drawables.back().layer);
}

TEST_F(SceneProjectorTest, PerLayerCounts) {
	const auto counts = countLayers(projectFull(90.0f, viewport));
	EXPECT_EQ(1, counts.at(Layer::Compass));
	EXPECT_EQ(1, counts.at(Layer::Trail));
	EXPECT_EQ(4, counts.at(Layer::Wall));
	EXPECT_EQ(8, counts.at(Layer::WallCorner));
	EXPECT_EQ(1, counts.at(Layer::Door));
	// Body + crossbar.
	EXPECT_EQ(2, counts.at(Layer::Window));
	// Body + front tick for each of 2 objects.
	EXPECT_EQ(4, counts.at(Layer::Object));
	EXPECT_EQ(1, counts.at(Layer::Device));
	EXPECT_EQ(1, counts.at(Layer::DeviceFov));
	EXPECT_GT(counts.at(Layer::Grid), 0);
}

TEST_F(SceneProjectorTest, CompassOmittedWithoutHeading) {
	const auto counts = countLayers(projectFull(boost::none, viewport));
	EXPECT_EQ(0, counts.count(Layer::Compass));
	EXPECT_EQ(4, counts.at(Layer::Wall));
}

TEST_F(SceneProjectorTest, CompassPointsAgainstHeading) {
	const SceneProjector projector(config, ProjectionOptions::full());
	const auto north = projector.project(nullptr, {}, viewport, 0.0f, boost::none, canvas);
	const auto east = projector.project(nullptr, {}, viewport, 90.0f, boost::none, canvas);
	for(const auto& d : north) {
		if(d.layer == Layer::Compass) {
			EXPECT_NEAR(400, d.points[0].x(), 1e-4);
			EXPECT_NEAR(50, d.points[0].y(), 1e-4);
			EXPECT_NEAR(400, d.points[1].x(), 1e-4);
			EXPECT_NEAR(20, d.points[1].y(), 1e-4);
		}
	}
	// Facing east, north is to the left.
	for(const auto& d : east) {
		if(d.layer == Layer::Compass) {
			EXPECT_NEAR(370, d.points[1].x(), 1e-4);
			EXPECT_NEAR(50, d.points[1].y(), 1e-4);
		}
	}
}

TEST_F(SceneProjectorTest, WithoutSnapshotOnlyBackgroundAndTrail) {
	const SceneProjector projector(config, ProjectionOptions::full());
	const auto drawables = projector.project(nullptr, shortTrail(), viewport, 10.0f,
		floorscan::RigidTransform(), canvas);
	for(const auto& d : drawables) {
		EXPECT_TRUE(d.layer == Layer::Grid || d.layer == Layer::Compass || d.layer == Layer::Trail)
			<< floorscan::layerName(d.layer);
	}
	EXPECT_EQ(1, countLayers(drawables).at(Layer::Trail));
}

TEST_F(SceneProjectorTest, SingleSampleTrailNotDrawn) {
	const SceneProjector projector(config, ProjectionOptions::full());
	const auto drawables = projector.project(room.get(), {Eigen::Vector3f(0, 0, 0)},
		viewport, boost::none, boost::none, canvas);
	EXPECT_EQ(0, countLayers(drawables).count(Layer::Trail));
}

TEST_F(SceneProjectorTest, TrailIsDashed) {
	for(const auto& d : projectFull(boost::none, viewport)) {
		if(d.layer == Layer::Trail) {
			ASSERT_EQ(3, d.points.size());
			ASSERT_EQ(2, d.style.dash.size());
			EXPECT_FLOAT_EQ(5, d.style.dash[0]);
			EXPECT_FLOAT_EQ(3, d.style.dash[1]);
			// (0.5, 0.2) * 40 + (400, 300)
			EXPECT_NEAR(420, d.points[1].x(), 1e-4);
			EXPECT_NEAR(308, d.points[1].y(), 1e-4);
		}
	}
}

TEST_F(SceneProjectorTest, PanShiftsEveryPrimitive) {
	ProjectionOptions options;
	// Grid and compass are anchored to the canvas, not the world.
	options.grid = false;
	options.compass = false;
	const SceneProjector projector(config, options);
	const Eigen::Vector2f delta(-35.5f, 12.25f);
	const ViewportState panned(viewport.getScale(), viewport.getOffset(), delta);

	const auto device = floorscan::estimateDeviceTransform(*room);
	const auto base = projector.project(room.get(), shortTrail(), viewport, boost::none, device, canvas);
	const auto moved = projector.project(room.get(), shortTrail(), panned, boost::none, device, canvas);
	ASSERT_EQ(base.size(), moved.size());
	for(const int i : boost::irange<int>(0, base.size())) {
		EXPECT_EQ(base[i].layer, moved[i].layer);
		ASSERT_EQ(base[i].points.size(), moved[i].points.size());
		for(const int j : boost::irange<int>(0, base[i].points.size())) {
			EXPECT_NEAR(base[i].points[j].x() + delta.x(), moved[i].points[j].x(), 1e-3);
			EXPECT_NEAR(base[i].points[j].y() + delta.y(), moved[i].points[j].y(), 1e-3);
		}
		EXPECT_FLOAT_EQ(base[i].radius, moved[i].radius);
	}
}

TEST_F(SceneProjectorTest, PreviewHasOnlyRoomElements) {
	const SceneProjector projector(config, ProjectionOptions::preview());
	const auto drawables = projector.project(room.get(), shortTrail(), viewport, 45.0f,
		floorscan::estimateDeviceTransform(*room), canvas);
	const auto counts = countLayers(drawables);
	EXPECT_EQ(0, counts.count(Layer::Grid));
	EXPECT_EQ(0, counts.count(Layer::Compass));
	EXPECT_EQ(0, counts.count(Layer::Trail));
	EXPECT_EQ(0, counts.count(Layer::Device));
	EXPECT_EQ(0, counts.count(Layer::DeviceFov));
	EXPECT_EQ(4, counts.at(Layer::Wall));
}

TEST_F(SceneProjectorTest, WallsFollowDecomposedEndpoints) {
	const auto drawables = projectFull(boost::none, viewport);
	std::vector<Drawable> walls;
	for(const auto& d : drawables) {
		if(d.layer == Layer::Wall) {
			walls.push_back(d);
		}
	}
	ASSERT_EQ(room->getWalls().size(), walls.size());
	for(const int i : boost::irange<int>(0, walls.size())) {
		const auto ends = floorscan::wallEndpoints(room->getWalls()[i]);
		EXPECT_NEAR(0, (walls[i].points[0] - viewport.toCanvas(ends.first)).norm(), 1e-3);
		EXPECT_NEAR(0, (walls[i].points[1] - viewport.toCanvas(ends.second)).norm(), 1e-3);
		EXPECT_FLOAT_EQ(6, walls[i].style.stroke_width);
	}
}

TEST_F(SceneProjectorTest, DoorIsThinRectangle) {
	for(const auto& d : projectFull(boost::none, viewport)) {
		if(d.layer == Layer::Door) {
			ASSERT_EQ(4, d.points.size());
			// door-south: width 0.9 at (1, 2) -> 36px wide, 6px tall around (440, 380)
			EXPECT_NEAR(422, d.points[0].x(), 1e-3);
			EXPECT_NEAR(377, d.points[0].y(), 1e-3);
			EXPECT_NEAR(458, d.points[2].x(), 1e-3);
			EXPECT_NEAR(383, d.points[2].y(), 1e-3);
			EXPECT_TRUE(static_cast<bool>(d.style.fill));
		}
	}
}

TEST_F(SceneProjectorTest, DeviceGlyphFacesForward) {
	// Identity basis: forward is +Z, i.e. down on the canvas.
	const auto device = floorscan::RigidTransform::fromPosition(Eigen::Vector3f(0, 1, 0));
	const SceneProjector projector(config, ProjectionOptions::full());
	const auto drawables = projector.project(room.get(), {}, viewport, boost::none, device, canvas);
	bool found = false;
	for(const auto& d : drawables) {
		if(d.layer == Layer::Device) {
			found = true;
			ASSERT_EQ(3, d.points.size());
			EXPECT_NEAR(400, d.points[0].x(), 1e-3);
			EXPECT_NEAR(300 + config.device_glyph_size_px, d.points[0].y(), 1e-3);
		} else if(d.layer == Layer::DeviceFov) {
			ASSERT_EQ(3, d.points.size());
			// Wedge symmetric around +Y of the canvas, 40px long.
			EXPECT_NEAR(400, d.points[0].x(), 1e-3);
			EXPECT_NEAR(800, d.points[1].x() + d.points[2].x(), 1e-3);
			EXPECT_NEAR(config.fov_length_px, (d.points[1] - d.points[0]).norm(), 1e-3);
			EXPECT_NEAR(300 + config.fov_length_px * std::cos(floorscan::pi / 6), d.points[1].y(), 1e-3);
		}
	}
	EXPECT_TRUE(found);
}

TEST_F(SceneProjectorTest, GridCoarsensWhenDense) {
	// 2 px/m would give lines every 2px; coarsened to 8px (4m).
	const ViewportState far(2, Eigen::Vector2f(401, 300), Eigen::Vector2f::Zero());
	const SceneProjector projector(config, ProjectionOptions::full());
	std::vector<float> xs;
	for(const auto& d : projector.project(nullptr, {}, far, boost::none, boost::none, canvas)) {
		ASSERT_EQ(Layer::Grid, d.layer);
		if(d.points[0].x() == d.points[1].x()) {
			xs.push_back(d.points[0].x());
		}
	}
	ASSERT_EQ(100, xs.size());
	// Aligned to world origin at x=401.
	EXPECT_FLOAT_EQ(1, xs.front());
	for(const int i : boost::irange<int>(1, xs.size())) {
		EXPECT_NEAR(8, xs[i] - xs[i - 1], 1e-3);
	}
}

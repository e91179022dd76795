#include "floor_plan_session.h"

#include <limits>

#include <boost/range/irange.hpp>
#include <gtest/gtest.h>

#include <scan/toy_room.h>

using floorscan::Clock;
using floorscan::FloorPlanSession;
using floorscan::Layer;

namespace {

int countLayer(const floorscan::Frame& frame, Layer layer) {
	int count = 0;
	for(const auto& d : frame.drawables) {
		if(d.layer == layer) {
			count++;
		}
	}
	return count;
}

}  // namespace

TEST(FloorPlanSession, InitialStateRendersFallback) {
	const FloorPlanSession session{floorscan::PlanConfig()};
	EXPECT_FALSE(session.hasSnapshot());
	EXPECT_FALSE(session.getHeading());
	EXPECT_EQ(0, session.getTrail().size());

	const auto frame = session.renderFrame();
	EXPECT_FLOAT_EQ(20, frame.viewport.getScale());
	EXPECT_GT(countLayer(frame, Layer::Grid), 0);
	EXPECT_EQ(0, countLayer(frame, Layer::Wall));

	const auto doc = session.exportDocument();
	EXPECT_EQ(0, doc["walls"].size());
	EXPECT_FLOAT_EQ(0, doc["dimensions"]["length"].asFloat());
}

TEST(FloorPlanSession, LatestSnapshotReplacesPrevious) {
	FloorPlanSession session{floorscan::PlanConfig()};
	const auto t0 = Clock::now();
	session.applySnapshot(floorscan::createPartialToyRoom(2), t0);
	EXPECT_EQ(2, session.getSnapshot()->getCounts().walls);
	session.applySnapshot(floorscan::createToyRoom(), t0 + std::chrono::milliseconds(10));
	EXPECT_EQ(4, session.getSnapshot()->getCounts().walls);
	EXPECT_EQ(4, countLayer(session.renderFrame(), Layer::Wall));

	// Null is ignored.
	session.applySnapshot(nullptr, t0 + std::chrono::milliseconds(20));
	EXPECT_TRUE(session.hasSnapshot());
}

TEST(FloorPlanSession, TrailFollowsWallCentroidThrottled) {
	FloorPlanSession session{floorscan::PlanConfig()};
	const auto t0 = Clock::now();
	// Snapshots every 50ms; 200ms throttle keeps every 5th.
	for(const int i : boost::irange(0, 20)) {
		session.applySnapshot(floorscan::createPartialToyRoom(1 + i % 4),
			t0 + std::chrono::milliseconds(i * 50));
	}
	const auto samples = session.getTrail().getSamples();
	ASSERT_EQ(4, samples.size());
	// i = 0: only the north wall.
	EXPECT_NEAR(-2, samples[0].z(), 1e-5);
	EXPECT_EQ(1, countLayer(session.renderFrame(), Layer::Trail));
}

TEST(FloorPlanSession, HeadingIsNormalized) {
	FloorPlanSession session{floorscan::PlanConfig()};
	session.setHeading(-90.0f);
	ASSERT_TRUE(static_cast<bool>(session.getHeading()));
	EXPECT_FLOAT_EQ(270, *session.getHeading());
	EXPECT_EQ(1, countLayer(session.renderFrame(), Layer::Compass));

	session.setHeading(std::numeric_limits<float>::quiet_NaN());
	EXPECT_FALSE(session.getHeading());
	EXPECT_EQ(0, countLayer(session.renderFrame(), Layer::Compass));

	session.setHeading(10.0f);
	session.setHeading(boost::none);
	EXPECT_FALSE(session.getHeading());
}

TEST(FloorPlanSession, PanPersistsAcrossRefits) {
	FloorPlanSession session{floorscan::PlanConfig()};
	const auto t0 = Clock::now();
	session.applySnapshot(floorscan::createPartialToyRoom(3), t0);
	session.panBy(Eigen::Vector2f(10.0f, 5.0f));
	session.panBy(Eigen::Vector2f(-4.0f, 1.0f));
	EXPECT_FLOAT_EQ(6, session.getPan().x());
	EXPECT_FLOAT_EQ(6, session.getPan().y());

	// New geometry changes the fit, not the pan.
	session.applySnapshot(floorscan::createToyRoom(), t0 + std::chrono::seconds(1));
	const auto frame = session.renderFrame();
	EXPECT_FLOAT_EQ(6, frame.viewport.getPan().x());
	EXPECT_FLOAT_EQ(6, frame.viewport.getPan().y());

	session.panBy(Eigen::Vector2f(std::numeric_limits<float>::infinity(), 0.0f));
	EXPECT_FLOAT_EQ(6, session.getPan().x());
}

TEST(FloorPlanSession, SetPanReplacesAccumulatedPan) {
	FloorPlanSession session{floorscan::PlanConfig()};
	session.applySnapshot(floorscan::createToyRoom(), Clock::now());
	const auto unpanned = session.renderFrame();
	session.panBy(Eigen::Vector2f(10.0f, 5.0f));
	session.setPan(Eigen::Vector2f(-20.0f, 30.0f));
	EXPECT_FLOAT_EQ(-20, session.getPan().x());
	EXPECT_FLOAT_EQ(30, session.getPan().y());

	// Same fit, every wall shifted by exactly the pan.
	const auto panned = session.renderFrame();
	EXPECT_FLOAT_EQ(unpanned.viewport.getScale(), panned.viewport.getScale());
	ASSERT_EQ(unpanned.drawables.size(), panned.drawables.size());
	for(size_t i = 0; i < panned.drawables.size(); i++) {
		if(panned.drawables[i].layer != Layer::Wall) {
			continue;
		}
		const Eigen::Vector2f shift =
			panned.drawables[i].points[0] - unpanned.drawables[i].points[0];
		EXPECT_NEAR(-20, shift.x(), 1e-3);
		EXPECT_NEAR(30, shift.y(), 1e-3);
	}

	session.setPan(Eigen::Vector2f(std::numeric_limits<float>::quiet_NaN(), 0.0f));
	EXPECT_FLOAT_EQ(-20, session.getPan().x());
	session.setPan(Eigen::Vector2f::Zero());
	EXPECT_FLOAT_EQ(0, session.getPan().norm());
}

TEST(FloorPlanSession, PreviewIgnoresTrailAndPan) {
	FloorPlanSession session{floorscan::PlanConfig()};
	session.applySnapshot(floorscan::createToyRoom(), Clock::now());
	session.setHeading(30.0f);
	session.panBy(Eigen::Vector2f(50.0f, 50.0f));

	const auto preview = session.renderPreview();
	EXPECT_FLOAT_EQ(0, preview.viewport.getPan().norm());
	EXPECT_EQ(0, countLayer(preview, Layer::Grid));
	EXPECT_EQ(0, countLayer(preview, Layer::Compass));
	EXPECT_EQ(0, countLayer(preview, Layer::Device));
	EXPECT_EQ(4, countLayer(preview, Layer::Wall));
	// Larger margin factor than the live view.
	EXPECT_GT(preview.viewport.getScale(), session.renderFrame().viewport.getScale());
}

TEST(FloorPlanSession, ResetClearsEverything) {
	FloorPlanSession session{floorscan::PlanConfig()};
	session.applySnapshot(floorscan::createToyRoom(), Clock::now());
	session.setHeading(45.0f);
	session.panBy(Eigen::Vector2f(3.0f, 3.0f));
	session.reset();
	EXPECT_FALSE(session.hasSnapshot());
	EXPECT_FALSE(session.getHeading());
	EXPECT_EQ(0, session.getTrail().size());
	EXPECT_FLOAT_EQ(0, session.getPan().norm());
}

TEST(FloorPlanSession, CanvasMustBePositive) {
	FloorPlanSession session{floorscan::PlanConfig()};
	session.setCanvas(floorscan::CanvasSize{320, 240});
	EXPECT_EQ(320, session.getCanvas().width);
	EXPECT_THROW(session.setCanvas(floorscan::CanvasSize{0, 240}), std::invalid_argument);
}

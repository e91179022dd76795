#pragma once

#include <vector>

#include <boost/optional.hpp>
#include <Eigen/Dense>
#include <jsoncpp/json/json.h>

#include <config.h>
#include <scan/snapshot.h>
#include <tracking/trail_recorder.h>
#include <view/drawable.h>
#include <view/scene_projector.h>
#include <view/viewport.h>

namespace floorscan {

// Output of one render pass.
struct Frame {
	ViewportState viewport;
	std::vector<Drawable> drawables;
};

// State of one mapping session: latest snapshot, heading, device trail
// and user pan. Not thread-safe; updates from other threads must go
// through CaptureInbox.
class FloorPlanSession {
public:
	explicit FloorPlanSession(const PlanConfig& config);

	// Replace the current snapshot and offer the estimated device
	// position to the trail. A null snapshot is ignored.
	void applySnapshot(SnapshotPtr snapshot, Clock::time_point now);

	// Normalized into [0, 360). none or non-finite clears the heading.
	void setHeading(const boost::optional<float>& heading_deg);
	boost::optional<float> getHeading() const;

	// Pan is in canvas pixels and survives re-fits.
	void panBy(const Eigen::Vector2f& delta);
	void setPan(const Eigen::Vector2f& pan);
	Eigen::Vector2f getPan() const;

	// Throws std::invalid_argument for non-positive size.
	void setCanvas(const CanvasSize& canvas);
	CanvasSize getCanvas() const;

	// Back to the initial state (no snapshot, heading, trail or pan).
	void reset();

	bool hasSnapshot() const;
	SnapshotPtr getSnapshot() const;
	const TrailRecorder& getTrail() const;

	// Live mapping view. Fitted from scratch on every call.
	Frame renderFrame() const;

	// Static overview of walls, openings and objects; ignores trail and pan.
	Frame renderPreview() const;

	Json::Value exportDocument() const;
private:
	const PlanConfig config;
	CanvasSize canvas;
	SnapshotPtr snapshot;
	boost::optional<float> heading;
	TrailRecorder trail;
	Eigen::Vector2f pan;
};

}  // namespace

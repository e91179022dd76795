#include "floor_plan_session.h"

#include <stdexcept>

#include <export/dimension_extractor.h>
#include <logging.h>
#include <math_util.h>

namespace floorscan {

FloorPlanSession::FloorPlanSession(const PlanConfig& config) :
		config(config),
		canvas{config.canvas_width, config.canvas_height},
		trail(config.trail_capacity, std::chrono::milliseconds(config.trail_interval_ms)),
		pan(Eigen::Vector2f::Zero()) {
}

void FloorPlanSession::applySnapshot(SnapshotPtr new_snapshot, Clock::time_point now) {
	if(!new_snapshot) {
		WARN("Ignoring null snapshot");
		return;
	}
	snapshot = new_snapshot;
	const auto position = estimateDevicePosition(*snapshot);
	if(position) {
		trail.offer(*position, now);
	}
}

void FloorPlanSession::setHeading(const boost::optional<float>& heading_deg) {
	if(!heading_deg) {
		heading = boost::none;
		return;
	}
	heading = normalizeHeading(*heading_deg);
	if(!heading) {
		DEBUG("Dropped non-finite heading");
	}
}

boost::optional<float> FloorPlanSession::getHeading() const {
	return heading;
}

void FloorPlanSession::panBy(const Eigen::Vector2f& delta) {
	if(!delta.allFinite()) {
		WARN("Ignoring non-finite pan", delta.x(), delta.y());
		return;
	}
	pan += delta;
}

void FloorPlanSession::setPan(const Eigen::Vector2f& new_pan) {
	if(!new_pan.allFinite()) {
		WARN("Ignoring non-finite pan", new_pan.x(), new_pan.y());
		return;
	}
	pan = new_pan;
}

Eigen::Vector2f FloorPlanSession::getPan() const {
	return pan;
}

void FloorPlanSession::setCanvas(const CanvasSize& new_canvas) {
	if(new_canvas.width <= 0 || new_canvas.height <= 0) {
		throw std::invalid_argument("Canvas size must be positive");
	}
	canvas = new_canvas;
}

CanvasSize FloorPlanSession::getCanvas() const {
	return canvas;
}

void FloorPlanSession::reset() {
	snapshot.reset();
	heading = boost::none;
	trail.reset();
	pan = Eigen::Vector2f::Zero();
}

bool FloorPlanSession::hasSnapshot() const {
	return static_cast<bool>(snapshot);
}

SnapshotPtr FloorPlanSession::getSnapshot() const {
	return snapshot;
}

const TrailRecorder& FloorPlanSession::getTrail() const {
	return trail;
}

Frame FloorPlanSession::renderFrame() const {
	const std::vector<Eigen::Vector3f> samples = trail.getSamples();
	const ViewportState viewport =
		ViewportFitter::fromConfig(config).fit(snapshot.get(), samples, canvas, pan);
	boost::optional<RigidTransform> device;
	if(snapshot) {
		device = estimateDeviceTransform(*snapshot);
	}
	const SceneProjector projector(config, ProjectionOptions::full());
	return Frame{viewport,
		projector.project(snapshot.get(), samples, viewport, heading, device, canvas)};
}

Frame FloorPlanSession::renderPreview() const {
	const std::vector<Eigen::Vector3f> no_trail;
	const ViewportState viewport = ViewportFitter::previewFromConfig(config)
		.fit(snapshot.get(), no_trail, canvas, Eigen::Vector2f::Zero());
	const SceneProjector projector(config, ProjectionOptions::preview());
	return Frame{viewport,
		projector.project(snapshot.get(), no_trail, viewport, boost::none, boost::none, canvas)};
}

Json::Value FloorPlanSession::exportDocument() const {
	return buildExportDocument(snapshot.get());
}

}  // namespace

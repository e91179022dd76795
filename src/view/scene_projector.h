#pragma once

#include <vector>

#include <boost/optional.hpp>
#include <Eigen/Dense>

#include <config.h>
#include <scan/rigid_transform.h>
#include <scan/snapshot.h>
#include <view/drawable.h>
#include <view/viewport.h>

namespace floorscan {

// Which optional layers to produce.
struct ProjectionOptions {
	bool grid = true;
	bool compass = true;
	bool trail = true;
	bool device = true;

	// Everything (live mapping view).
	static ProjectionOptions full();
	// Walls, openings and objects only.
	static ProjectionOptions preview();
};

// Converts the current scene into an ordered (back to front) list of
// canvas-space primitives. Pure; the whole list is rebuilt every frame.
class SceneProjector {
public:
	SceneProjector(const PlanConfig& config, const ProjectionOptions& options);

	// snapshot may be null (nothing captured yet); then only grid,
	// compass and trail are produced. Device glyph is drawn only when
	// both snapshot and device are given.
	std::vector<Drawable> project(
		const Snapshot* snapshot,
		const std::vector<Eigen::Vector3f>& trail,
		const ViewportState& viewport,
		const boost::optional<float>& heading,
		const boost::optional<RigidTransform>& device,
		const CanvasSize& canvas) const;
private:
	void projectGrid(std::vector<Drawable>& out,
		const ViewportState& viewport, const CanvasSize& canvas) const;
	void projectCompass(std::vector<Drawable>& out,
		float heading, const CanvasSize& canvas) const;
	void projectTrail(std::vector<Drawable>& out,
		const std::vector<Eigen::Vector3f>& trail, const ViewportState& viewport) const;
	void projectWalls(std::vector<Drawable>& out,
		const Snapshot& snapshot, const ViewportState& viewport) const;
	// Doors and windows; windows get a crossbar.
	void projectOpenings(std::vector<Drawable>& out,
		const std::vector<SurfaceElement>& openings, const ViewportState& viewport) const;
	void projectObjects(std::vector<Drawable>& out,
		const Snapshot& snapshot, const ViewportState& viewport) const;
	void projectDevice(std::vector<Drawable>& out,
		const RigidTransform& device, const ViewportState& viewport) const;

	PlanConfig config;
	ProjectionOptions options;
};

}  // namespace

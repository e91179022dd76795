#pragma once

#include <vector>

#include <boost/optional.hpp>
#include <Eigen/Dense>

#include <config.h>
#include <geom/util.h>
#include <scan/snapshot.h>

namespace floorscan {

struct CanvasSize {
	int width;
	int height;
};

// Mapping from floor-plane meters to canvas pixels:
// canvas = world * scale + offset + pan
// The fitted offset and the user pan are kept separately; pan
// survives every re-fit.
class ViewportState {
public:
	ViewportState(float scale, const Eigen::Vector2f& offset, const Eigen::Vector2f& pan);

	float getScale() const;
	Eigen::Vector2f getOffset() const;
	Eigen::Vector2f getPan() const;

	Eigen::Vector2f toCanvas(const Eigen::Vector2f& world) const;
	float toPixels(float meters) const;
private:
	float scale;  // px / m
	Eigen::Vector2f offset;
	Eigen::Vector2f pan;
};


// Fits current geometry into a fixed-size canvas. Stateless; meant to
// be called every frame.
class ViewportFitter {
public:
	ViewportFitter(float padding, float margin_factor, float fallback_scale, float epsilon);

	static ViewportFitter fromConfig(const PlanConfig& config);
	static ViewportFitter previewFromConfig(const PlanConfig& config);

	// Unpadded floor-plane bounds over both endpoints of every wall and
	// every trail position. snapshot may be null (nothing captured yet).
	// Non-finite contributors are skipped. none if nothing contributes.
	boost::optional<AABB2f> computeExtents(
		const Snapshot* snapshot, const std::vector<Eigen::Vector3f>& trail) const;

	// Pad extents, then pick the largest scale (times margin factor) at
	// which they fit, centered in canvas. Falls back to fallback scale
	// when extents are missing or thinner than epsilon; missing extents
	// put the world origin at the canvas center.
	ViewportState fit(const boost::optional<AABB2f>& extents,
		const CanvasSize& canvas, const Eigen::Vector2f& pan) const;

	ViewportState fit(const Snapshot* snapshot, const std::vector<Eigen::Vector3f>& trail,
		const CanvasSize& canvas, const Eigen::Vector2f& pan) const;
private:
	float padding;
	float margin_factor;
	float fallback_scale;
	float epsilon;
};

}  // namespace

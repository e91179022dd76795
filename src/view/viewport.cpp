#include "viewport.h"

#include <algorithm>
#include <cmath>

#include <geom/transform_decomposer.h>
#include <logging.h>

namespace floorscan {

ViewportState::ViewportState(float scale, const Eigen::Vector2f& offset, const Eigen::Vector2f& pan) :
	scale(scale), offset(offset), pan(pan) {
}

float ViewportState::getScale() const {
	return scale;
}

Eigen::Vector2f ViewportState::getOffset() const {
	return offset;
}

Eigen::Vector2f ViewportState::getPan() const {
	return pan;
}

Eigen::Vector2f ViewportState::toCanvas(const Eigen::Vector2f& world) const {
	return world * scale + offset + pan;
}

float ViewportState::toPixels(float meters) const {
	return meters * scale;
}


ViewportFitter::ViewportFitter(float padding, float margin_factor, float fallback_scale, float epsilon) :
	padding(padding), margin_factor(margin_factor),
	fallback_scale(fallback_scale), epsilon(epsilon) {
}

ViewportFitter ViewportFitter::fromConfig(const PlanConfig& config) {
	return ViewportFitter(config.padding, config.margin_factor,
		config.fallback_scale, config.epsilon);
}

ViewportFitter ViewportFitter::previewFromConfig(const PlanConfig& config) {
	return ViewportFitter(config.padding, config.preview_margin_factor,
		config.fallback_scale, config.epsilon);
}

boost::optional<AABB2f> ViewportFitter::computeExtents(
		const Snapshot* snapshot, const std::vector<Eigen::Vector3f>& trail) const {
	boost::optional<AABB2f> extents;
	int skipped = 0;
	auto include = [&extents, &skipped](const Eigen::Vector2f& p) {
		if(!p.allFinite()) {
			skipped++;
			return;
		}
		extents = extents ? extents->extended(p) : AABB2f::fromPoint(p);
	};

	if(snapshot != nullptr) {
		for(const auto& wall : snapshot->getWalls()) {
			const auto ends = wallEndpoints(wall, epsilon);
			include(ends.first);
			include(ends.second);
		}
	}
	for(const auto& pos : trail) {
		include(toPlane(pos));
	}
	if(skipped > 0) {
		DEBUG("Skipped non-finite points in viewport extents", skipped);
	}
	return extents;
}

ViewportState ViewportFitter::fit(const boost::optional<AABB2f>& extents,
		const CanvasSize& canvas, const Eigen::Vector2f& pan) const {
	const Eigen::Vector2f canvas_size(
		static_cast<float>(canvas.width), static_cast<float>(canvas.height));
	if(!extents) {
		return ViewportState(fallback_scale, canvas_size / 2, pan);
	}
	const AABB2f bounds = extents->padded(padding);
	const Eigen::Vector2f size = bounds.getSize();

	float scale = fallback_scale;
	if(size.x() >= epsilon && size.y() >= epsilon) {
		scale = std::min(canvas_size.x() / size.x(), canvas_size.y() / size.y()) * margin_factor;
	}
	if(!(scale > 0) || !std::isfinite(scale)) {
		WARN("Viewport fit produced unusable scale, using fallback", scale);
		scale = fallback_scale;
	}
	// (canvas - size * scale) / 2 - min * scale
	const Eigen::Vector2f offset = canvas_size / 2 - bounds.getCenter() * scale;
	return ViewportState(scale, offset, pan);
}

ViewportState ViewportFitter::fit(const Snapshot* snapshot, const std::vector<Eigen::Vector3f>& trail,
		const CanvasSize& canvas, const Eigen::Vector2f& pan) const {
	return fit(computeExtents(snapshot, trail), canvas, pan);
}

}  // namespace

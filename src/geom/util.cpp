#include "util.h"

namespace floorscan {

AABB2f::AABB2f(const Eigen::Vector2f& vmin, const Eigen::Vector2f& vmax) :
	vmin(vmin), vmax(vmax) {
}

AABB2f AABB2f::fromPoint(const Eigen::Vector2f& p) {
	return AABB2f(p, p);
}

Eigen::Vector2f AABB2f::getMin() const {
	return vmin;
}

Eigen::Vector2f AABB2f::getMax() const {
	return vmax;
}

Eigen::Vector2f AABB2f::getCenter() const {
	return (vmin + vmax) / 2;
}

Eigen::Vector2f AABB2f::getSize() const {
	return vmax - vmin;
}

bool AABB2f::contains(const Eigen::Vector2f& query) const {
	return (vmin.array() <= query.array()).all() &&
		(query.array() <= vmax.array()).all();
}

AABB2f AABB2f::padded(float margin) const {
	const Eigen::Vector2f offset = Eigen::Vector2f::Constant(margin);
	return AABB2f(vmin - offset, vmax + offset);
}

AABB2f AABB2f::extended(const Eigen::Vector2f& p) const {
	return AABB2f(vmin.cwiseMin(p), vmax.cwiseMax(p));
}

AABB2f operator|(AABB2f lhs, const AABB2f& rhs) {
	return AABB2f(
		lhs.getMin().cwiseMin(rhs.getMin()),
		lhs.getMax().cwiseMax(rhs.getMax()));
}


AABB3f::AABB3f(const Eigen::Vector3f& vmin, const Eigen::Vector3f& vmax) :
	vmin(vmin), vmax(vmax) {
}

AABB3f AABB3f::fromCenterSize(const Eigen::Vector3f& center, const Eigen::Vector3f& size) {
	const Eigen::Vector3f half = size / 2;
	return AABB3f(center - half, center + half);
}

Eigen::Vector3f AABB3f::getMin() const {
	return vmin;
}

Eigen::Vector3f AABB3f::getMax() const {
	return vmax;
}

Eigen::Vector3f AABB3f::getCenter() const {
	return (vmin + vmax) / 2;
}

Eigen::Vector3f AABB3f::getSize() const {
	return vmax - vmin;
}

bool AABB3f::contains(const Eigen::Vector3f& query) const {
	return (vmin.array() <= query.array()).all() &&
		(query.array() <= vmax.array()).all();
}

AABB3f operator|(AABB3f lhs, const AABB3f& rhs) {
	return AABB3f(
		lhs.getMin().cwiseMin(rhs.getMin()),
		lhs.getMax().cwiseMax(rhs.getMax()));
}

}  // namespace

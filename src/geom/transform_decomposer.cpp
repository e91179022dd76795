#include "transform_decomposer.h"

#include <cmath>

namespace floorscan {

Eigen::Vector2f toPlane(const Eigen::Vector3f& p) {
	return Eigen::Vector2f(p.x(), p.z());
}

Eigen::Vector2f horizontalDirection(const Eigen::Vector3f& v, float epsilon) {
	const Eigen::Vector2f h = toPlane(v);
	const float length = h.norm();
	// Also catches NaN (comparison is false).
	if(!(length >= epsilon) || !std::isfinite(length)) {
		return Eigen::Vector2f(1, 0);
	}
	return h / length;
}

PlanarPose decomposeByRight(const RigidTransform& transform, float epsilon) {
	const Eigen::Vector2f dir = horizontalDirection(transform.getRight(), epsilon);
	PlanarPose pose;
	pose.position = toPlane(transform.getPosition());
	pose.yaw = std::atan2(dir.y(), dir.x());
	return pose;
}

PlanarPose decomposeByForward(const RigidTransform& transform, float epsilon) {
	const Eigen::Vector2f dir = horizontalDirection(transform.getForward(), epsilon);
	PlanarPose pose;
	pose.position = toPlane(transform.getPosition());
	pose.yaw = std::atan2(dir.x(), dir.y());
	return pose;
}

std::pair<Eigen::Vector2f, Eigen::Vector2f> wallEndpoints(
		const RigidTransform& transform, float width, float epsilon) {
	const Eigen::Vector2f center = toPlane(transform.getPosition());
	const Eigen::Vector2f half = horizontalDirection(transform.getRight(), epsilon) * (width / 2);
	return std::make_pair(center - half, center + half);
}

std::pair<Eigen::Vector2f, Eigen::Vector2f> wallEndpoints(
		const SurfaceElement& wall, float epsilon) {
	return wallEndpoints(wall.transform, wall.dimensions.x(), epsilon);
}

}  // namespace

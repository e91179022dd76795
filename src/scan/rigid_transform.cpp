#include "rigid_transform.h"

#include <cmath>

namespace floorscan {

RigidTransform::RigidTransform() {
	matrix.setIdentity();
}

RigidTransform::RigidTransform(const Eigen::Matrix4f& matrix) :
	matrix(matrix) {
}

RigidTransform RigidTransform::fromBasis(
		const Eigen::Vector3f& position,
		const Eigen::Vector3f& right,
		const Eigen::Vector3f& up,
		const Eigen::Vector3f& forward) {
	Eigen::Matrix4f m = Eigen::Matrix4f::Identity();
	m.block<3, 1>(0, 0) = right;
	m.block<3, 1>(0, 1) = up;
	m.block<3, 1>(0, 2) = forward;
	m.block<3, 1>(0, 3) = position;
	return RigidTransform(m);
}

RigidTransform RigidTransform::fromPosition(const Eigen::Vector3f& position) {
	return fromBasis(position,
		Eigen::Vector3f::UnitX(),
		Eigen::Vector3f::UnitY(),
		Eigen::Vector3f::UnitZ());
}

RigidTransform RigidTransform::fromYaw(const Eigen::Vector3f& position, float yaw) {
	const float c = std::cos(yaw);
	const float s = std::sin(yaw);
	// right x up = forward keeps the basis right-handed.
	const Eigen::Vector3f right(c, 0, s);
	const Eigen::Vector3f up(0, 1, 0);
	return fromBasis(position, right, up, right.cross(up));
}

Eigen::Vector3f RigidTransform::getPosition() const {
	return matrix.block<3, 1>(0, 3);
}

Eigen::Vector3f RigidTransform::getRight() const {
	return matrix.block<3, 1>(0, 0);
}

Eigen::Vector3f RigidTransform::getForward() const {
	return matrix.block<3, 1>(0, 2);
}

Eigen::Matrix4f RigidTransform::getMatrix() const {
	return matrix;
}

}  // namespace

#pragma once

#include <Eigen/Dense>

namespace floorscan {

// Position + (right, up, forward) basis, as a 4x4 homogeneous matrix.
// Column layout: right, up, forward, position. Last row is (0 0 0 1).
//
// Sensor noise may make the basis slightly non-orthonormal, and
// vectors may be near-zero; nothing here normalizes or validates.
class RigidTransform {
public:
	// Identity at origin.
	RigidTransform();
	explicit RigidTransform(const Eigen::Matrix4f& matrix);

	static RigidTransform fromBasis(
		const Eigen::Vector3f& position,
		const Eigen::Vector3f& right,
		const Eigen::Vector3f& up,
		const Eigen::Vector3f& forward);

	static RigidTransform fromPosition(const Eigen::Vector3f& position);

	// Rotation by yaw (radians) about +Y, right = (cos, 0, sin).
	static RigidTransform fromYaw(const Eigen::Vector3f& position, float yaw);

	Eigen::Vector3f getPosition() const;
	Eigen::Vector3f getRight() const;
	Eigen::Vector3f getForward() const;
	Eigen::Matrix4f getMatrix() const;
private:
	// Unaligned so that elements can live in plain std::vector.
	Eigen::Matrix<float, 4, 4, Eigen::DontAlign> matrix;
};

}  // namespace

// Decomposition of 3D rigid transforms into floor-plane quantities.
//
// The floor plane is X-Z; a 2D point is (x, z). All functions are
// pure and never throw. Degenerate basis vectors (horizontal length
// below epsilon, or non-finite) are replaced by the default direction
// (1, 0).
#pragma once

#include <utility>

#include <Eigen/Dense>

#include <scan/rigid_transform.h>
#include <scan/snapshot.h>

namespace floorscan {

constexpr float default_decompose_epsilon = 1e-3f;

// 2D position + yaw (radians) on the floor plane.
struct PlanarPose {
	Eigen::Vector2f position;
	float yaw;
};

// Drop the vertical axis: (x, y, z) -> (x, z).
Eigen::Vector2f toPlane(const Eigen::Vector3f& p);

// Normalized horizontal direction of v, or (1, 0) if degenerate.
Eigen::Vector2f horizontalDirection(const Eigen::Vector3f& v, float epsilon = default_decompose_epsilon);

// Wall/object convention: yaw = atan2(dir.z, dir.x) of the right vector.
PlanarPose decomposeByRight(const RigidTransform& transform, float epsilon = default_decompose_epsilon);

// Device convention: yaw = atan2(forward.x, forward.z).
PlanarPose decomposeByForward(const RigidTransform& transform, float epsilon = default_decompose_epsilon);

// position -/+ (width / 2) along the normalized right vector.
std::pair<Eigen::Vector2f, Eigen::Vector2f> wallEndpoints(
	const RigidTransform& transform, float width, float epsilon = default_decompose_epsilon);

std::pair<Eigen::Vector2f, Eigen::Vector2f> wallEndpoints(
	const SurfaceElement& wall, float epsilon = default_decompose_epsilon);

}  // namespace

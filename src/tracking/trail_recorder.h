#pragma once

#include <chrono>
#include <vector>

#include <boost/circular_buffer.hpp>
#include <boost/optional.hpp>
#include <Eigen/Dense>

#include <scan/rigid_transform.h>
#include <scan/snapshot.h>

namespace floorscan {

using Clock = std::chrono::steady_clock;

// Estimated device position: centroid of wall positions.
// The capture feed doesn't expose the true device pose, so this is a
// coarse stand-in that drifts as walls get detected.
// Returns none when there's no wall.
boost::optional<Eigen::Vector3f> estimateDevicePosition(const Snapshot& snapshot);

// Device transform at the estimated position, with identity basis
// (facing +Z). none when there's no wall.
boost::optional<RigidTransform> estimateDeviceTransform(const Snapshot& snapshot);

// Bounded, time-throttled history of device positions.
//
// A sample is accepted when more than interval has elapsed since the
// last accepted one (the first sample is always accepted). When full,
// the oldest sample is evicted. Positions are stored as given,
// without smoothing.
class TrailRecorder {
public:
	TrailRecorder(int capacity, std::chrono::milliseconds interval);

	// Returns true if sample was recorded. Non-finite positions are
	// always rejected.
	bool offer(const Eigen::Vector3f& position, Clock::time_point now);

	// Forget everything, including the last acceptance time.
	void reset();

	// Oldest first.
	std::vector<Eigen::Vector3f> getSamples() const;
	int size() const;
	int capacity() const;
private:
	const std::chrono::milliseconds interval;
	boost::circular_buffer<Eigen::Vector3f> samples;
	boost::optional<Clock::time_point> last_accepted;
};

}  // namespace

#include "trail_recorder.h"

#include <stdexcept>

#include <logging.h>

namespace floorscan {

boost::optional<Eigen::Vector3f> estimateDevicePosition(const Snapshot& snapshot) {
	const auto& walls = snapshot.getWalls();
	if(walls.empty()) {
		return boost::none;
	}
	Eigen::Vector3f sum = Eigen::Vector3f::Zero();
	for(const auto& wall : walls) {
		sum += wall.transform.getPosition();
	}
	return Eigen::Vector3f(sum / static_cast<float>(walls.size()));
}

boost::optional<RigidTransform> estimateDeviceTransform(const Snapshot& snapshot) {
	const auto position = estimateDevicePosition(snapshot);
	if(!position) {
		return boost::none;
	}
	return RigidTransform::fromPosition(*position);
}


TrailRecorder::TrailRecorder(int capacity, std::chrono::milliseconds interval) :
		interval(interval) {
	if(capacity <= 0) {
		throw std::invalid_argument("TrailRecorder capacity must be positive");
	}
	samples.set_capacity(capacity);
}

bool TrailRecorder::offer(const Eigen::Vector3f& position, Clock::time_point now) {
	if(!position.allFinite()) {
		DEBUG("Rejected non-finite trail sample");
		return false;
	}
	if(last_accepted && (now - *last_accepted) <= interval) {
		return false;
	}
	// circular_buffer overwrites the oldest element when full.
	samples.push_back(position);
	last_accepted = now;
	return true;
}

void TrailRecorder::reset() {
	samples.clear();
	last_accepted = boost::none;
}

std::vector<Eigen::Vector3f> TrailRecorder::getSamples() const {
	return std::vector<Eigen::Vector3f>(samples.begin(), samples.end());
}

int TrailRecorder::size() const {
	return samples.size();
}

int TrailRecorder::capacity() const {
	return samples.capacity();
}

}  // namespace

#include "snapshot_source.h"

#include <stdexcept>

#include <boost/range/irange.hpp>

#include <logging.h>
#include <scan/snapshot_codec.h>
#include <scan/toy_room.h>

namespace floorscan {

ReplaySnapshotSource::ReplaySnapshotSource(const Json::Value& replay) : cursor(0) {
	if(!replay.isObject() || !replay["frames"].isArray()) {
		throw std::runtime_error("Replay must be an object with 'frames' array");
	}
	const Json::Value& frames_json = replay["frames"];
	for(const int i : boost::irange<int>(0, frames_json.size())) {
		const Json::Value& frame = frames_json[i];
		const std::string context = "frames[" + std::to_string(i) + "]";
		if(!frame.isObject()) {
			throw std::runtime_error(context + " must be an object");
		}
		if(!frame["t_ms"].isNumeric() || frame["t_ms"].asDouble() < 0) {
			throw std::runtime_error(context + ": 't_ms' must be a non-negative number");
		}
		boost::optional<float> heading;
		if(frame.isMember("heading") && !frame["heading"].isNull()) {
			if(!frame["heading"].isNumeric()) {
				throw std::runtime_error(context + ": 'heading' must be a number");
			}
			heading = frame["heading"].asFloat();
		}
		if(!frame.isMember("room")) {
			throw std::runtime_error(context + ": missing 'room'");
		}
		frames.push_back(CaptureFrame{
			std::chrono::milliseconds(frame["t_ms"].asInt64()),
			heading,
			decodeSnapshot(frame["room"])});
	}
	INFO("Loaded replay", static_cast<int>(frames.size()));
}

ReplaySnapshotSource ReplaySnapshotSource::fromFile(const std::string& path) {
	return ReplaySnapshotSource(loadJsonFile(path));
}

boost::optional<CaptureFrame> ReplaySnapshotSource::next() {
	if(cursor >= static_cast<int>(frames.size())) {
		return boost::none;
	}
	return frames[cursor++];
}

int ReplaySnapshotSource::size() const {
	return frames.size();
}


ToyScanSource::ToyScanSource(int num_frames, int interval_ms) :
		num_frames(num_frames), interval_ms(interval_ms), cursor(0) {
	if(num_frames <= 0 || interval_ms < 0) {
		throw std::invalid_argument("ToyScanSource needs positive #frames and non-negative interval");
	}
}

boost::optional<CaptureFrame> ToyScanSource::next() {
	if(cursor >= num_frames) {
		return boost::none;
	}
	const int i = cursor++;
	// Reveal one more wall every 1/5 of the scan; full room in the last 1/5.
	const int stage = (i * 5) / num_frames;
	const SnapshotPtr snapshot = (stage < 4) ? createPartialToyRoom(stage + 1) : createToyRoom();
	const float heading = (360.0f * i) / num_frames;
	return CaptureFrame{std::chrono::milliseconds(i * interval_ms), heading, snapshot};
}

}  // namespace

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>

#include <scan/snapshot.h>

namespace floorscan {

// One update of the capture feed.
struct CaptureFrame {
	// Time since the start of the capture.
	std::chrono::milliseconds t;
	boost::optional<float> heading;
	SnapshotPtr snapshot;
};


// A capture feed: stream of snapshots (and headings) in delivery order.
class SnapshotSourceInterface {
public:
	virtual ~SnapshotSourceInterface() = default;

	// Return next frame, or none when the feed is exhausted.
	virtual boost::optional<CaptureFrame> next() = 0;
};


// Replays a recorded capture:
// {"frames": [{"t_ms": number, "heading": number (optional), "room": snapshot}, ...]}
class ReplaySnapshotSource : public SnapshotSourceInterface {
public:
	// Throws std::runtime_error when replay is malformed.
	explicit ReplaySnapshotSource(const Json::Value& replay);

	// Throws std::runtime_error when the file is unreadable or malformed.
	static ReplaySnapshotSource fromFile(const std::string& path);

	boost::optional<CaptureFrame> next() override;
	int size() const;
private:
	std::vector<CaptureFrame> frames;
	int cursor;
};


// Synthetic scan of the toy room: walls show up one by one, then the
// openings and objects, while the heading sweeps around.
class ToyScanSource : public SnapshotSourceInterface {
public:
	// num_frames must be positive. Frames are interval_ms apart.
	ToyScanSource(int num_frames, int interval_ms);

	boost::optional<CaptureFrame> next() override;
private:
	const int num_frames;
	const int interval_ms;
	int cursor;
};

}  // namespace

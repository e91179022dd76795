#pragma once

#include <mutex>

#include <boost/optional.hpp>

#include <scan/snapshot.h>
#include <session/floor_plan_session.h>
#include <tracking/trail_recorder.h>

namespace floorscan {

// Used to pass snapshots & headings from capture threads to the
// thread that owns FloorPlanSession. Holds only the latest value of
// each; older undrained values are dropped.
class CaptureInbox {
public:
	CaptureInbox();

	void postSnapshot(SnapshotPtr snapshot);
	// none clears the heading on the next drain.
	void postHeading(const boost::optional<float>& heading_deg);

	// Apply pending updates to session (on the session's thread).
	// Returns true when anything was applied.
	bool drainInto(FloorPlanSession& session, Clock::time_point now);

	// Number of posts overwritten before being drained.
	int getDroppedCount();
private:
	std::mutex inbox_lock;
	SnapshotPtr pending_snapshot;
	bool heading_pending;
	boost::optional<float> pending_heading;
	int dropped;
};

}  // namespace

#include "capture_inbox.h"

#include <logging.h>

namespace floorscan {

CaptureInbox::CaptureInbox() : heading_pending(false), dropped(0) {
}

void CaptureInbox::postSnapshot(SnapshotPtr snapshot) {
	std::lock_guard<std::mutex> lock(inbox_lock);
	if(pending_snapshot) {
		dropped++;
	}
	pending_snapshot = snapshot;
}

void CaptureInbox::postHeading(const boost::optional<float>& heading_deg) {
	std::lock_guard<std::mutex> lock(inbox_lock);
	if(heading_pending) {
		dropped++;
	}
	heading_pending = true;
	pending_heading = heading_deg;
}

bool CaptureInbox::drainInto(FloorPlanSession& session, Clock::time_point now) {
	SnapshotPtr snapshot;
	bool has_heading = false;
	boost::optional<float> heading;
	{
		std::lock_guard<std::mutex> lock(inbox_lock);
		snapshot.swap(pending_snapshot);
		has_heading = heading_pending;
		heading = pending_heading;
		heading_pending = false;
		pending_heading = boost::none;
	}
	// Session is touched outside the lock; it's owned by the caller's thread.
	if(has_heading) {
		session.setHeading(heading);
	}
	if(snapshot) {
		session.applySnapshot(snapshot, now);
	}
	return has_heading || snapshot;
}

int CaptureInbox::getDroppedCount() {
	std::lock_guard<std::mutex> lock(inbox_lock);
	return dropped;
}

}  // namespace

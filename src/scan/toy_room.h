#pragma once

#include <scan/snapshot.h>

namespace floorscan {

// A 6m x 4m x 2.5m rectangular room centered at the origin,
// with one door, one window and two rotated objects.
// Walls are 0.1m thick; wall ids are "wall-north", "wall-south",
// "wall-west", "wall-east".
SnapshotPtr createToyRoom();

// Same room where only the first num_walls walls (in the order
// above) have been detected so far, and no openings/objects.
// Used to imitate a scan in progress.
SnapshotPtr createPartialToyRoom(int num_walls);

}  // namespace

// Merges backend item snapshots into the caller-owned item list.
#pragma once
#include "OperationTypes.hpp"

#include <map>
#include <vector>

namespace jobwatch {

// Applies one snapshot to `items` in place and returns true if any observable
// field (status, progress, stage, terminalReached) changed.
//  - Keys without a matching Item::index are skipped (item removed locally).
//  - Items with terminalReached are never touched again.
//  - completed forces progress to 100; error keeps the last known progress
//    unless the backend reported one explicitly. Both freeze the item.
//  - Anything else is copied verbatim; unreported fields keep their value.
// Does not know about operations; applying the same snapshot twice is a no-op
// the second time.
bool reconcileItems(std::vector<Item> &items,
                    const std::map<int, ItemSnapshot> &snapshot);

// Index lookup by join key (not by position).
Item *findItemByIndex(std::vector<Item> &items, int index);

} // namespace jobwatch

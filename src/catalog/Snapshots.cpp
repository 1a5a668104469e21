#include "catalog/Snapshots.hpp"
#include "catalog/Errors.hpp"

namespace catalog {

const std::string& pick_snapshot_version(const std::string& date, const SnapshotMap& snapshots) {
    // first version strictly greater than date; the one before it is the answer
    auto it = snapshots.upper_bound(date);
    if (it == snapshots.begin()) throw NoApplicableSnapshot(date);
    --it;
    return it->first;
}

const std::vector<std::string>& pick_snapshot(const std::string& date, const SnapshotMap& snapshots) {
    return snapshots.at(pick_snapshot_version(date, snapshots));
}

}  // namespace catalog

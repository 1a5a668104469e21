#pragma once
#include <map>
#include <string>
#include <vector>

namespace catalog {

// version ("YYYY-MM") -> ordered college names; std::map keeps versions sorted
using SnapshotMap = std::map<std::string, std::vector<std::string>>;

// Greatest version <= date. Versions are YYYY-MM, so string order is date order.
// Throws NoApplicableSnapshot when every version is later than date.
const std::string& pick_snapshot_version(const std::string& date, const SnapshotMap& snapshots);

// Payload of pick_snapshot_version; the reference stays valid as long as `snapshots` does.
const std::vector<std::string>& pick_snapshot(const std::string& date, const SnapshotMap& snapshots);

}  // namespace catalog

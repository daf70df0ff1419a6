#include "cdp/store/in_memory_position_store.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace cdp {

// -----------------------------------------------------------------------------
// load: shared read of one record
// -----------------------------------------------------------------------------
std::optional<domain::Cdp> InMemoryPositionStore::load(
    const domain::CdpId& id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryPositionStore::insert(const domain::Cdp& cdp) {
  std::unique_lock lock(mutex_);
  auto [it, inserted] = positions_.emplace(cdp.id, cdp);
  if (!inserted) {
    std::cerr << "[PositionStore] Duplicate insert rejected for " << cdp.id
              << "\n";
  }
  return inserted;
}

// -----------------------------------------------------------------------------
// commit: verify all versions, then write all records
// -----------------------------------------------------------------------------
bool InMemoryPositionStore::commit(
    const std::unordered_map<domain::CdpId, std::uint64_t>& expected_versions,
    const std::vector<domain::Cdp>& updated) {
  std::unique_lock lock(mutex_);

  // Pass 1: check only. Nothing is written unless every record matches.
  for (const domain::Cdp& cdp : updated) {
    auto expected = expected_versions.find(cdp.id);
    if (expected == expected_versions.end()) {
      std::cerr << "[PositionStore] Commit rejected: no expected version for "
                << cdp.id << "\n";
      return false;
    }

    auto stored = positions_.find(cdp.id);
    if (stored == positions_.end()) {
      std::cerr << "[PositionStore] Commit rejected: unknown CDP " << cdp.id
                << "\n";
      return false;
    }

    if (stored->second.version != expected->second) {
      std::cerr << "[PositionStore] Version conflict on " << cdp.id
                << ": expected " << expected->second << ", stored "
                << stored->second.version << "\n";
      return false;
    }
  }

  // Pass 2: write. A batch may carry several snapshots of the same id; the
  // last one is the final state.
  for (const domain::Cdp& cdp : updated) {
    positions_[cdp.id] = cdp;
  }
  return true;
}

std::vector<domain::Cdp> InMemoryPositionStore::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Cdp> result;
  result.reserve(positions_.size());
  for (const auto& [id, cdp] : positions_) {
    result.push_back(cdp);
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Cdp& a, const domain::Cdp& b) {
              return a.id < b.id;
            });
  return result;
}

std::size_t InMemoryPositionStore::size() const {
  std::shared_lock lock(mutex_);
  return positions_.size();
}

}  // namespace cdp

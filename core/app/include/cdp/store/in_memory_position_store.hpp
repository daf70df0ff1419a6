#pragma once

#include "cdp/store/i_position_store.hpp"

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

namespace cdp {

// -----------------------------------------------------------------------------
// InMemoryPositionStore — thread-safe map-backed IPositionStore
// -----------------------------------------------------------------------------
//
// @brief  Reference store used by the replay driver and tests.
//
// @details
// Readers (load, snapshots) take a shared_lock; writers (insert, commit)
// take a unique_lock. commit() checks every expected version under the
// same exclusive lock that performs the writes, so the check and the
// write are one atomic step with respect to other commits.
//
// Version conflicts are logged to stderr as "[PositionStore] ..." lines.
// -----------------------------------------------------------------------------
class InMemoryPositionStore : public IPositionStore {
 public:
  InMemoryPositionStore() = default;

  std::optional<domain::Cdp> load(const domain::CdpId& id) const override;

  bool insert(const domain::Cdp& cdp) override;

  bool commit(
      const std::unordered_map<domain::CdpId, std::uint64_t>& expected_versions,
      const std::vector<domain::Cdp>& updated) override;

  std::vector<domain::Cdp> snapshots() const override;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::CdpId, domain::Cdp> positions_;
};

}  // namespace cdp

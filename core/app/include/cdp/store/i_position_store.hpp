#pragma once

#include "cdp/domain/cdp.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cdp {

// -----------------------------------------------------------------------------
// IPositionStore — persistence seam for committed CDP snapshots
// -----------------------------------------------------------------------------
//
// @brief  Abstract interface between the pure executors and whatever holds
//         the authoritative CDP records (memory, database, chain adapter).
//
// @details
// The executors never touch a store. A caller loads a snapshot, runs one
// operation or a batch, and then hands the resulting CDPs back through
// commit() together with the versions it first read. commit() is
// all-or-nothing: if any record moved on since it was read, nothing is
// written and the caller reloads and retries.
//
// This is how two concurrent operations on the same CDP are serialized:
// both compute from version N, the first commit moves the record to N+k,
// and the second commit fails its version check.
//
// Ownership:
//   Implementations own their records. load() returns copies.
// -----------------------------------------------------------------------------
class IPositionStore {
 public:
  virtual ~IPositionStore() = default;

  // Copy of the stored snapshot, or std::nullopt if the id is unknown.
  virtual std::optional<domain::Cdp> load(const domain::CdpId& id) const = 0;

  // Adds a new position. Returns false if the id already exists.
  virtual bool insert(const domain::Cdp& cdp) = 0;

  // -------------------------------------------------------------------------
  // commit(expected_versions, updated)
  // -------------------------------------------------------------------------
  // @brief  Atomically replaces every CDP in updated, provided each stored
  //         record still has the version listed in expected_versions.
  //
  // @param  expected_versions  id → version the caller read before running
  //                            the executors. Must cover every id in
  //                            updated.
  // @param  updated            Final snapshots to store.
  //
  // @return true if every check passed and every record was written;
  //         false if any id is unknown, missing from expected_versions, or
  //         has moved on. Nothing is written on false.
  // -------------------------------------------------------------------------
  virtual bool commit(
      const std::unordered_map<domain::CdpId, std::uint64_t>& expected_versions,
      const std::vector<domain::Cdp>& updated) = 0;

  virtual std::vector<domain::Cdp> snapshots() const = 0;
};

}  // namespace cdp

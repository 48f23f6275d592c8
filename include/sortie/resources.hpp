#pragma once

// sortie/resources.hpp: Resource reservation gate.
//
// Every plan step obtains a reservation for its estimated ResourceUsage
// before it is dispatched. reserve() is a synchronous, in-memory check under
// one mutex; it never blocks on I/O.
//
// INVARIANT: for every dimension, the sum of outstanding reservations never
// exceeds the configured limit. A request that would cause an overage is
// rejected before anything is recorded.
//
// EXTENSION_POINT: measured_usage_reconciliation
//   release() records the tool's measured usage in the cumulative totals. The
//   outstanding total always drops by the reserved estimate so the live
//   aggregate stays consistent with what was granted.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "sortie/types.hpp"

namespace sortie {

struct ResourceManagerStats {
  std::uint64_t granted{0};
  std::uint64_t rejected{0};
  std::uint64_t released{0};
  ResourceUsage peak;
  ResourceUsage cumulative_actual;
};

class ResourceManager {
 public:
  using Ticket = std::uint64_t;

  explicit ResourceManager(ResourceLimits limits);

  // Returns a ticket on success. On rejection returns nullopt and, when
  // `error` is non-null, names the first dimension that would overflow.
  std::optional<Ticket> reserve(const ResourceUsage& usage, std::string* error = nullptr);

  // Releases a reservation. `actual` is the measured usage when known.
  // Returns false for an unknown or already released ticket.
  bool release(Ticket ticket, const std::optional<ResourceUsage>& actual = std::nullopt);

  // True when `usage` would be granted right now.
  bool check_availability(const ResourceUsage& usage) const;
  // True when `usage` could be granted with nothing else reserved.
  bool can_ever_fit(const ResourceUsage& usage) const;

  ResourceState get_state() const;
  ResourceLimits limits() const { return limits_; }
  ResourceManagerStats stats() const;

 private:
  bool fits_locked(const ResourceUsage& usage, std::string* error) const;

  const ResourceLimits limits_;
  mutable std::mutex mu_;
  ResourceUsage in_use_;
  std::map<Ticket, ResourceUsage> outstanding_;
  Ticket next_ticket_{1};
  ResourceManagerStats stats_;
};

// Releases the reservation on scope exit unless release() was called first.
class ReservationGuard {
 public:
  ReservationGuard(ResourceManager& mgr, ResourceManager::Ticket ticket) : mgr_(&mgr), ticket_(ticket) {}
  ~ReservationGuard() {
    if (mgr_) mgr_->release(ticket_);
  }
  ReservationGuard(const ReservationGuard&) = delete;
  ReservationGuard& operator=(const ReservationGuard&) = delete;

  void release(const std::optional<ResourceUsage>& actual) {
    if (!mgr_) return;
    mgr_->release(ticket_, actual);
    mgr_ = nullptr;
  }

 private:
  ResourceManager* mgr_;
  ResourceManager::Ticket ticket_;
};

}  // namespace sortie

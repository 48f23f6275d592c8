#include "sortie/resources.hpp"

#include <algorithm>
#include <cmath>

#include "sortie/jsonlite.hpp"

namespace sortie {

namespace {

struct Dimension {
  const char* name;
  double ResourceUsage::*usage;
  double ResourceLimits::*limit;
};

constexpr Dimension kDimensions[] = {
    {"cpu_percent", &ResourceUsage::cpu_percent, &ResourceLimits::max_cpu_percent},
    {"memory_mb", &ResourceUsage::memory_mb, &ResourceLimits::max_memory_mb},
    {"network_mbps", &ResourceUsage::network_mbps, &ResourceLimits::max_network_mbps},
    {"storage_mb", &ResourceUsage::storage_mb, &ResourceLimits::max_storage_mb},
};

// Absorbs floating-point residue from repeated add/subtract.
constexpr double kEpsilon = 1e-9;

}  // namespace

ResourceManager::ResourceManager(ResourceLimits limits) : limits_(limits) {}

bool ResourceManager::fits_locked(const ResourceUsage& usage, std::string* error) const {
  for (const auto& d : kDimensions) {
    const double requested = usage.*d.usage;
    if (!std::isfinite(requested) || requested < 0.0) {
      if (error) *error = std::string("invalid resource request: ") + d.name;
      return false;
    }
    const double limit = limits_.*d.limit;
    const double total = in_use_.*d.usage + requested;
    if (total > limit + kEpsilon) {
      if (error) {
        *error = std::string("resource_limit_exceeded: ") + d.name + " requested " +
                 jsonlite::format_double(requested) + ", in use " +
                 jsonlite::format_double(in_use_.*d.usage) + ", limit " +
                 jsonlite::format_double(limit);
      }
      return false;
    }
  }
  return true;
}

std::optional<ResourceManager::Ticket> ResourceManager::reserve(const ResourceUsage& usage,
                                                                std::string* error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!fits_locked(usage, error)) {
    ++stats_.rejected;
    return std::nullopt;
  }
  in_use_ += usage;
  const Ticket t = next_ticket_++;
  outstanding_.emplace(t, usage);
  ++stats_.granted;
  for (const auto& d : kDimensions) {
    stats_.peak.*d.usage = std::max(stats_.peak.*d.usage, in_use_.*d.usage);
  }
  return t;
}

bool ResourceManager::release(Ticket ticket, const std::optional<ResourceUsage>& actual) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = outstanding_.find(ticket);
  if (it == outstanding_.end()) return false;
  for (const auto& d : kDimensions) {
    in_use_.*d.usage = std::max(0.0, in_use_.*d.usage - it->second.*d.usage);
  }
  stats_.cumulative_actual += actual ? *actual : it->second;
  ++stats_.released;
  outstanding_.erase(it);
  if (outstanding_.empty()) in_use_ = ResourceUsage{};
  return true;
}

bool ResourceManager::check_availability(const ResourceUsage& usage) const {
  std::lock_guard<std::mutex> lock(mu_);
  return fits_locked(usage, nullptr);
}

bool ResourceManager::can_ever_fit(const ResourceUsage& usage) const {
  for (const auto& d : kDimensions) {
    const double requested = usage.*d.usage;
    if (!std::isfinite(requested) || requested < 0.0) return false;
    if (requested > limits_.*d.limit + kEpsilon) return false;
  }
  return true;
}

ResourceState ResourceManager::get_state() const {
  std::lock_guard<std::mutex> lock(mu_);
  ResourceState s;
  s.in_use = in_use_;
  s.limits = limits_;
  s.active_reservations = outstanding_.size();
  return s;
}

ResourceManagerStats ResourceManager::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

}  // namespace sortie

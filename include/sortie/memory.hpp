#pragma once

// sortie/memory.hpp: Working memory: bounded recency log of engine events.
//
// INVARIANT: size() <= max_entries() at all times. Eviction is strict FIFO.
// Thread-safe; one mutex guards the ring.

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "sortie/types.hpp"

namespace sortie {

class WorkingMemory {
 public:
  static constexpr std::size_t kDefaultMaxEntries = 1000;

  explicit WorkingMemory(std::size_t max_entries = kDefaultMaxEntries);

  void add(const std::string& event, jsonlite::Value data, double importance);

  // The n most recently added entries, most recent first.
  std::vector<MemoryEntry> get_recent(std::size_t n) const;

  // Entries whose event name or serialized data contains `query`
  // (case-sensitive). Oldest first.
  std::vector<MemoryEntry> search(const std::string& query) const;

  std::size_t size() const;
  std::size_t max_entries() const { return max_entries_; }
  void clear();

 private:
  const std::size_t max_entries_;
  mutable std::mutex mu_;
  std::deque<MemoryEntry> entries_;
};

}  // namespace sortie

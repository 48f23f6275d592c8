#include "sortie/memory.hpp"

#include <algorithm>

namespace sortie {

WorkingMemory::WorkingMemory(std::size_t max_entries) : max_entries_(max_entries) {}

void WorkingMemory::add(const std::string& event, jsonlite::Value data, double importance) {
  MemoryEntry entry{now_unix_ms(), event, std::move(data), importance};
  std::lock_guard<std::mutex> lock(mu_);
  entries_.push_back(std::move(entry));
  while (entries_.size() > max_entries_) entries_.pop_front();
}

std::vector<MemoryEntry> WorkingMemory::get_recent(std::size_t n) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<MemoryEntry> out;
  out.reserve(std::min(n, entries_.size()));
  for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < n; ++it) {
    out.push_back(*it);
  }
  return out;
}

std::vector<MemoryEntry> WorkingMemory::search(const std::string& query) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<MemoryEntry> out;
  for (const auto& e : entries_) {
    if (e.event.find(query) != std::string::npos ||
        jsonlite::to_json(e.data).find(query) != std::string::npos) {
      out.push_back(e);
    }
  }
  return out;
}

std::size_t WorkingMemory::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void WorkingMemory::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

}  // namespace sortie

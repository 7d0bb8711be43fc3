#include "maintenance/table_lock_registry.h"
#include <stdexcept>

bool TableLockRegistry::acquireOrPark(const std::string &table,
                                      size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = held_.find(table);
  if (it == held_.end()) {
    held_.emplace(table, std::deque<size_t>());
    return true;
  }
  it->second.push_back(index);
  return false;
}

std::optional<size_t>
TableLockRegistry::releaseOrHandOff(const std::string &table) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = held_.find(table);
  if (it == held_.end()) {
    throw std::logic_error("Table token for " + table + " is not held");
  }
  if (it->second.empty()) {
    held_.erase(it);
    return std::nullopt;
  }
  size_t next = it->second.front();
  it->second.pop_front();
  return next;
}

bool TableLockRegistry::isHeld(const std::string &table) {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.count(table) > 0;
}

size_t TableLockRegistry::heldCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.size();
}

size_t TableLockRegistry::parkedCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t parked = 0;
  for (const auto &entry : held_)
    parked += entry.second.size();
  return parked;
}

#ifndef TABLE_LOCK_REGISTRY_H
#define TABLE_LOCK_REGISTRY_H

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Per-table tokens held by scheduler workers. At most one worker holds the
// token of a given table at any time. Work for a table whose token is taken
// is parked behind the holder instead of blocking the caller, and the holder
// picks it up in arrival order when it releases.
class TableLockRegistry {
  std::mutex mutex_;
  std::map<std::string, std::deque<size_t>> held_;

public:
  // Takes the token and returns true, or parks index behind the current
  // holder and returns false.
  bool acquireOrPark(const std::string &table, size_t index);

  // Returns the next parked index for table, in which case the caller keeps
  // the token, or releases the token and returns nothing.
  std::optional<size_t> releaseOrHandOff(const std::string &table);

  bool isHeld(const std::string &table);
  size_t heldCount();
  size_t parkedCount();
};

#endif

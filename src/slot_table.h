#ifndef KITRUN_SLOT_TABLE_H_
#define KITRUN_SLOT_TABLE_H_

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "kit_protocol.h"

namespace kitrun {

static constexpr const char kMainSlot[] = "main";

// Ownership of single-instance roles (for example the primary prompt window).
// A role has at most one owning session at a time.
class SlotTable {
 public:
  SlotTable() = default;
  SlotTable(const SlotTable &) = delete;
  SlotTable &operator=(const SlotTable &) = delete;

  // Fails with InvalidArgument naming the current owner when the role is taken.
  bool TryAcquire(const std::string &role, uint64_t session_id, KitError *error);
  // Only the current owner can release. Returns whether anything was released.
  bool Release(const std::string &role, uint64_t session_id);
  bool Owner(const std::string &role, uint64_t *session_id) const;
  std::vector<std::pair<std::string, uint64_t>> Snapshot() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> owners_;
};

// Scoped hold on a role; releases on destruction.
class SlotLease {
 public:
  SlotLease() : table_(nullptr), session_id_(0) {}
  SlotLease(const SlotLease &) = delete;
  SlotLease &operator=(const SlotLease &) = delete;
  SlotLease(SlotLease &&other) noexcept;
  SlotLease &operator=(SlotLease &&other) noexcept;
  ~SlotLease() { Reset(); }

  static bool Acquire(SlotTable *table, const std::string &role, uint64_t session_id, SlotLease *out,
                      KitError *error);
  bool held() const { return table_ != nullptr; }
  const std::string &role() const { return role_; }
  void Reset();

 private:
  SlotTable *table_;
  std::string role_;
  uint64_t session_id_;
};

}  // namespace kitrun

#endif  // KITRUN_SLOT_TABLE_H_

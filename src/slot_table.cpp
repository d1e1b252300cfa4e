#include "slot_table.h"

#include "log.h"

namespace kitrun {

bool SlotTable::TryAcquire(const std::string &role, uint64_t session_id, KitError *error) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = owners_.find(role);
  if (it != owners_.end()) {
    if (it->second == session_id) return true;
    return set_err(error, KitErrorCode::InvalidArgument,
                   "Slot '" + role + "' is owned by session " + std::to_string(it->second) + ".");
  }
  owners_[role] = session_id;
  log_event("SLOT_ACQUIRED", session_id, role);
  return true;
}

bool SlotTable::Release(const std::string &role, uint64_t session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = owners_.find(role);
  if (it == owners_.end() || it->second != session_id) return false;
  owners_.erase(it);
  log_event("SLOT_RELEASED", session_id, role);
  return true;
}

bool SlotTable::Owner(const std::string &role, uint64_t *session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = owners_.find(role);
  if (it == owners_.end()) return false;
  if (session_id) *session_id = it->second;
  return true;
}

std::vector<std::pair<std::string, uint64_t>> SlotTable::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::vector<std::pair<std::string, uint64_t>>(owners_.begin(), owners_.end());
}

SlotLease::SlotLease(SlotLease &&other) noexcept
    : table_(other.table_), role_(std::move(other.role_)), session_id_(other.session_id_) {
  other.table_ = nullptr;
}

SlotLease &SlotLease::operator=(SlotLease &&other) noexcept {
  if (this != &other) {
    Reset();
    table_ = other.table_;
    role_ = std::move(other.role_);
    session_id_ = other.session_id_;
    other.table_ = nullptr;
  }
  return *this;
}

bool SlotLease::Acquire(SlotTable *table, const std::string &role, uint64_t session_id, SlotLease *out,
                        KitError *error) {
  if (!table || !out) return set_err(error, KitErrorCode::InvalidArgument, "SlotLease::Acquire received null.");
  out->Reset();
  if (!table->TryAcquire(role, session_id, error)) return false;
  out->table_ = table;
  out->role_ = role;
  out->session_id_ = session_id;
  return true;
}

void SlotLease::Reset() {
  if (table_) table_->Release(role_, session_id_);
  table_ = nullptr;
}

}  // namespace kitrun

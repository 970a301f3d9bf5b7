#include "database.h"

using namespace sqlite_orm;

void Database::Init() {
  if (!db_) db_ = std::make_unique<Storage>(InitStorage(path_));
}

int64_t Database::Save(const PendingResult& res) {
  std::lock_guard lck(mtx_);
  Init();
  return db_->insert(res);
}

std::vector<PendingResult> Database::Pending(size_t num) {
  std::lock_guard lck(mtx_);
  Init();
  return db_->get_all<PendingResult>(order_by(&PendingResult::id), limit((int)num));
}

void Database::Remove(int64_t id) {
  std::lock_guard lck(mtx_);
  Init();
  db_->remove<PendingResult>(id);
}

void Database::MarkAttempt(int64_t id) {
  std::lock_guard lck(mtx_);
  Init();
  db_->update_all(set(c(&PendingResult::attempts) = c(&PendingResult::attempts) + 1),
                  where(c(&PendingResult::id) == id));
}

size_t Database::Count() {
  std::lock_guard lck(mtx_);
  Init();
  return db_->count<PendingResult>();
}

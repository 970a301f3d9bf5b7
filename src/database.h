#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <vector>
#include <filesystem>
#include <sqlite_orm/sqlite_orm.h>

// a final result that could not be delivered to the orchestrator
struct PendingResult {
  int64_t id;
  std::string submission_id;
  int64_t job_id;
  std::string payload; // report body
  int64_t created_at; // unix time
  int attempts;
};

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_pending_result_submission", &PendingResult::submission_id),
      make_table("pending_result",
                 make_column("id", &PendingResult::id, primary_key()),
                 make_column("submission_id", &PendingResult::submission_id),
                 make_column("job_id", &PendingResult::job_id),
                 make_column("payload", &PendingResult::payload),
                 make_column("created_at", &PendingResult::created_at),
                 make_column("attempts", &PendingResult::attempts, default_value(0))));
  storage.sync_schema(true);
  return storage;
}

} // namespace

class Database {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  std::filesystem::path path_;
  std::unique_ptr<Storage> db_;
  std::mutex mtx_;

  void Init();

 public:
  explicit Database(const std::filesystem::path& path) : path_(path) {}

  // return the assigned id
  int64_t Save(const PendingResult&);
  // oldest first
  std::vector<PendingResult> Pending(size_t limit);
  void Remove(int64_t id);
  void MarkAttempt(int64_t id);
  size_t Count();
};

#endif  // DATABASE_H_

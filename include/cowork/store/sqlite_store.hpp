#pragma once

#include "cowork/store/job_store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace cowork::store {

class SqliteJobStore final : public IJobStore {
public:
  explicit SqliteJobStore(std::filesystem::path db_path);
  ~SqliteJobStore() override;

  SqliteJobStore(const SqliteJobStore &) = delete;
  SqliteJobStore &operator=(const SqliteJobStore &) = delete;

  /// Opening or schema creation failure, if any.
  [[nodiscard]] common::Status status() const;

  [[nodiscard]] common::Status save_job(const events::ExecutionJob &job,
                                        const std::string &message) override;
  [[nodiscard]] common::Result<std::optional<JobRecord>> get_job(const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<JobRecord>>
  list_jobs(const std::optional<std::string> &session_id) override;
  [[nodiscard]] common::Status append_message(const std::string &session_id,
                                              const std::string &role,
                                              const std::string &content) override;
  [[nodiscard]] common::Result<std::vector<StoredMessage>>
  list_messages(const std::string &session_id) override;

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::vector<events::ToolStep>> load_steps(const std::string &job_id);
  [[nodiscard]] common::Result<std::vector<JobRecord>> query_jobs(const std::string &sql,
                                                                  const std::string &param);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace cowork::store

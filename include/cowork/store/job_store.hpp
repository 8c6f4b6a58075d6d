#pragma once

#include "cowork/common/result.hpp"
#include "cowork/events/types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cowork::store {

struct JobRecord {
  events::ExecutionJob job;
  /// Final answer or failure text; empty while the job runs.
  std::string message;
};

struct StoredMessage {
  std::string session_id;
  std::int64_t seq = 0;
  std::string role;
  std::string content;
  std::string created_at;
};

/// Keyed persistence for jobs, their steps and the per-session transcript.
class IJobStore {
public:
  virtual ~IJobStore() = default;

  /// Insert or replace the job together with its full step list.
  [[nodiscard]] virtual common::Status save_job(const events::ExecutionJob &job,
                                                const std::string &message) = 0;
  [[nodiscard]] virtual common::Result<std::optional<JobRecord>>
  get_job(const std::string &id) = 0;
  /// Newest first. No session lists every job.
  [[nodiscard]] virtual common::Result<std::vector<JobRecord>>
  list_jobs(const std::optional<std::string> &session_id) = 0;

  [[nodiscard]] virtual common::Status append_message(const std::string &session_id,
                                                      const std::string &role,
                                                      const std::string &content) = 0;
  /// Oldest first.
  [[nodiscard]] virtual common::Result<std::vector<StoredMessage>>
  list_messages(const std::string &session_id) = 0;
};

class InMemoryJobStore final : public IJobStore {
public:
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
  std::mutex mutex_;
  std::vector<JobRecord> jobs_;
  std::map<std::string, std::vector<StoredMessage>> messages_;
};

} // namespace cowork::store

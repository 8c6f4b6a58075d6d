#include "cowork/store/job_store.hpp"

#include "cowork/common/ids.hpp"

#include <algorithm>

namespace cowork::store {

common::Status InMemoryJobStore::save_job(const events::ExecutionJob &job,
                                          const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::find_if(jobs_.begin(), jobs_.end(),
                               [&job](const JobRecord &record) { return record.job.id == job.id; });
  if (it != jobs_.end()) {
    *it = JobRecord{.job = job, .message = message};
  } else {
    jobs_.push_back(JobRecord{.job = job, .message = message});
  }
  return common::Status::success();
}

common::Result<std::optional<JobRecord>> InMemoryJobStore::get_job(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &record : jobs_) {
    if (record.job.id == id) {
      return common::Result<std::optional<JobRecord>>::success(record);
    }
  }
  return common::Result<std::optional<JobRecord>>::success(std::nullopt);
}

common::Result<std::vector<JobRecord>>
InMemoryJobStore::list_jobs(const std::optional<std::string> &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobRecord> out;
  for (auto it = jobs_.rbegin(); it != jobs_.rend(); ++it) {
    if (!session_id.has_value() || it->job.session_id == *session_id) {
      out.push_back(*it);
    }
  }
  return common::Result<std::vector<JobRecord>>::success(std::move(out));
}

common::Status InMemoryJobStore::append_message(const std::string &session_id,
                                                const std::string &role,
                                                const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &session = messages_[session_id];
  session.push_back(StoredMessage{.session_id = session_id,
                                  .seq = static_cast<std::int64_t>(session.size()) + 1,
                                  .role = role,
                                  .content = content,
                                  .created_at = common::now_rfc3339()});
  return common::Status::success();
}

common::Result<std::vector<StoredMessage>>
InMemoryJobStore::list_messages(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = messages_.find(session_id);
  if (it == messages_.end()) {
    return common::Result<std::vector<StoredMessage>>::success({});
  }
  return common::Result<std::vector<StoredMessage>>::success(it->second);
}

} // namespace cowork::store

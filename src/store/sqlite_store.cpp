#include "cowork/store/sqlite_store.hpp"

#include "cowork/common/ids.hpp"

namespace cowork::store {

namespace {

constexpr const char *kNotOpen = "job store not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

void bind(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

/// Runs a prepared single-step statement and finalizes it.
common::Status step_done(sqlite3 *db, sqlite3_stmt *stmt) {
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db));
  }
  return common::Status::success();
}

} // namespace

SqliteJobStore::SqliteJobStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = "Failed to open job store " + db_path_.string() + ": " +
                  (db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory");
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  if (auto schema = init_schema(); !schema.ok()) {
    open_error_ = "Failed to initialize job store: " + schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteJobStore::~SqliteJobStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteJobStore::status() const {
  if (db_ == nullptr) {
    return common::Status::error(open_error_.empty() ? kNotOpen : open_error_);
  }
  return common::Status::success();
}

common::Status SqliteJobStore::init_schema() {
  return exec_sql(db_, R"(
PRAGMA foreign_keys = ON;
CREATE TABLE IF NOT EXISTS jobs (
  id TEXT PRIMARY KEY,
  session_id TEXT NOT NULL,
  status TEXT NOT NULL,
  query TEXT NOT NULL,
  created_at TEXT NOT NULL,
  message TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_jobs_session ON jobs(session_id);
CREATE TABLE IF NOT EXISTS steps (
  job_id TEXT NOT NULL REFERENCES jobs(id) ON DELETE CASCADE,
  position INTEGER NOT NULL,
  id TEXT NOT NULL,
  tool_name TEXT NOT NULL,
  tool_args TEXT NOT NULL,
  status TEXT NOT NULL,
  result TEXT,
  requires_approval INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL,
  PRIMARY KEY (job_id, position)
);
CREATE TABLE IF NOT EXISTS messages (
  session_id TEXT NOT NULL,
  seq INTEGER NOT NULL,
  role TEXT NOT NULL,
  content TEXT NOT NULL,
  created_at TEXT NOT NULL,
  PRIMARY KEY (session_id, seq)
);
)");
}

common::Status SqliteJobStore::save_job(const events::ExecutionJob &job,
                                        const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotOpen);
  }
  if (auto begin = exec_sql(db_, "BEGIN IMMEDIATE"); !begin.ok()) {
    return begin;
  }
  const auto rollback = [this](common::Status failed) {
    (void)exec_sql(db_, "ROLLBACK");
    return failed;
  };

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "INSERT OR REPLACE INTO jobs(id, session_id, status, query, created_at, "
                         "message) VALUES(?1, ?2, ?3, ?4, ?5, ?6)",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return rollback(common::Status::error(sqlite3_errmsg(db_)));
  }
  bind(stmt, 1, job.id);
  bind(stmt, 2, job.session_id);
  bind(stmt, 3, std::string(events::to_string(job.status)));
  bind(stmt, 4, job.query);
  bind(stmt, 5, job.created_at);
  bind(stmt, 6, message);
  if (auto done = step_done(db_, stmt); !done.ok()) {
    return rollback(done);
  }

  if (sqlite3_prepare_v2(db_, "DELETE FROM steps WHERE job_id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return rollback(common::Status::error(sqlite3_errmsg(db_)));
  }
  bind(stmt, 1, job.id);
  if (auto done = step_done(db_, stmt); !done.ok()) {
    return rollback(done);
  }

  for (std::size_t position = 0; position < job.steps.size(); ++position) {
    const auto &step = job.steps[position];
    if (sqlite3_prepare_v2(db_,
                           "INSERT INTO steps(job_id, position, id, tool_name, tool_args, status, "
                           "result, requires_approval, created_at) "
                           "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)",
                           -1, &stmt, nullptr) != SQLITE_OK) {
      return rollback(common::Status::error(sqlite3_errmsg(db_)));
    }
    bind(stmt, 1, job.id);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(position));
    bind(stmt, 3, step.id);
    bind(stmt, 4, step.tool_name);
    bind(stmt, 5, step.tool_args);
    bind(stmt, 6, std::string(events::to_string(step.status)));
    if (step.result.has_value()) {
      bind(stmt, 7, *step.result);
    } else {
      sqlite3_bind_null(stmt, 7);
    }
    sqlite3_bind_int(stmt, 8, step.requires_approval ? 1 : 0);
    bind(stmt, 9, step.created_at);
    if (auto done = step_done(db_, stmt); !done.ok()) {
      return rollback(done);
    }
  }
  return exec_sql(db_, "COMMIT");
}

common::Result<std::vector<events::ToolStep>> SqliteJobStore::load_steps(const std::string &job_id) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT id, tool_name, tool_args, status, result, requires_approval, "
                         "created_at FROM steps WHERE job_id = ?1 ORDER BY position ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<events::ToolStep>>::failure(sqlite3_errmsg(db_));
  }
  bind(stmt, 1, job_id);
  std::vector<events::ToolStep> steps;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    events::ToolStep step;
    step.id = column_text(stmt, 0);
    step.tool_name = column_text(stmt, 1);
    step.tool_args = column_text(stmt, 2);
    step.status = events::step_status_from_string(column_text(stmt, 3));
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
      step.result = column_text(stmt, 4);
    }
    step.requires_approval = sqlite3_column_int(stmt, 5) != 0;
    step.created_at = column_text(stmt, 6);
    steps.push_back(std::move(step));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<events::ToolStep>>::success(std::move(steps));
}

common::Result<std::vector<JobRecord>> SqliteJobStore::query_jobs(const std::string &sql,
                                                                  const std::string &param) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<JobRecord>>::failure(sqlite3_errmsg(db_));
  }
  if (!param.empty()) {
    bind(stmt, 1, param);
  }
  std::vector<JobRecord> records;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    JobRecord record;
    record.job.id = column_text(stmt, 0);
    record.job.session_id = column_text(stmt, 1);
    record.job.status = events::job_status_from_string(column_text(stmt, 2));
    record.job.query = column_text(stmt, 3);
    record.job.created_at = column_text(stmt, 4);
    record.message = column_text(stmt, 5);
    records.push_back(std::move(record));
  }
  sqlite3_finalize(stmt);

  for (auto &record : records) {
    auto steps = load_steps(record.job.id);
    if (!steps.ok()) {
      return common::Result<std::vector<JobRecord>>::failure(steps.error());
    }
    record.job.steps = std::move(steps.value());
    record.job.current_step_index =
        record.job.steps.empty() ? 0 : record.job.steps.size() - 1;
  }
  return common::Result<std::vector<JobRecord>>::success(std::move(records));
}

common::Result<std::optional<JobRecord>> SqliteJobStore::get_job(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<JobRecord>>::failure(kNotOpen);
  }
  auto records = query_jobs(
      "SELECT id, session_id, status, query, created_at, message FROM jobs WHERE id = ?1", id);
  if (!records.ok()) {
    return common::Result<std::optional<JobRecord>>::failure(records.error());
  }
  if (records.value().empty()) {
    return common::Result<std::optional<JobRecord>>::success(std::nullopt);
  }
  return common::Result<std::optional<JobRecord>>::success(std::move(records.value().front()));
}

common::Result<std::vector<JobRecord>>
SqliteJobStore::list_jobs(const std::optional<std::string> &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<JobRecord>>::failure(kNotOpen);
  }
  if (session_id.has_value()) {
    return query_jobs("SELECT id, session_id, status, query, created_at, message FROM jobs "
                      "WHERE session_id = ?1 ORDER BY created_at DESC, rowid DESC",
                      *session_id);
  }
  return query_jobs("SELECT id, session_id, status, query, created_at, message FROM jobs "
                    "ORDER BY created_at DESC, rowid DESC",
                    "");
}

common::Status SqliteJobStore::append_message(const std::string &session_id,
                                              const std::string &role,
                                              const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotOpen);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO messages(session_id, seq, role, content, created_at) "
      "VALUES(?1, (SELECT COALESCE(MAX(seq), 0) + 1 FROM messages WHERE session_id = ?1), ?2, "
      "?3, ?4)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind(stmt, 1, session_id);
  bind(stmt, 2, role);
  bind(stmt, 3, content);
  bind(stmt, 4, common::now_rfc3339());
  return step_done(db_, stmt);
}

common::Result<std::vector<StoredMessage>>
SqliteJobStore::list_messages(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<StoredMessage>>::failure(kNotOpen);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT seq, role, content, created_at FROM messages WHERE session_id = "
                         "?1 ORDER BY seq ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<StoredMessage>>::failure(sqlite3_errmsg(db_));
  }
  bind(stmt, 1, session_id);
  std::vector<StoredMessage> out;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    out.push_back(StoredMessage{.session_id = session_id,
                                .seq = sqlite3_column_int64(stmt, 0),
                                .role = column_text(stmt, 1),
                                .content = column_text(stmt, 2),
                                .created_at = column_text(stmt, 3)});
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<StoredMessage>>::success(std::move(out));
}

} // namespace cowork::store

#include "voxrelay/transcripts/store.hpp"

#include "voxrelay/common/ids.hpp"

namespace voxrelay::transcripts {

namespace {

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

std::string column_text(sqlite3_stmt *stmt, int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

} // namespace

TranscriptStore::TranscriptStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  if (const auto schema = init_schema(); !schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

TranscriptStore::~TranscriptStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status TranscriptStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("transcript db not initialized");
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS transcript_entries (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id TEXT NOT NULL,
  turn_id INTEGER NOT NULL,
  role TEXT NOT NULL,
  text TEXT NOT NULL,
  created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_transcript_session ON transcript_entries(session_id, id);
)");
}

common::Status TranscriptStore::insert_row(const std::string &session_id,
                                           const std::uint64_t turn_id, const char *role,
                                           const std::string &text,
                                           const std::string &created_at) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO transcript_entries(session_id, turn_id, role, text, created_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(turn_id));
  sqlite3_bind_text(stmt, 3, role, -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status TranscriptStore::record_turn(const std::string &session_id,
                                            const std::uint64_t turn_id,
                                            const std::string &user_text,
                                            const std::string &assistant_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("transcript db not initialized");
  }

  if (auto begin = exec_sql(db_, "BEGIN IMMEDIATE;"); !begin.ok()) {
    return begin;
  }
  const std::string now = common::iso8601_now();
  auto status = insert_row(session_id, turn_id, "user", user_text, now);
  if (status.ok()) {
    status = insert_row(session_id, turn_id, "assistant", assistant_text, now);
  }
  if (!status.ok()) {
    if (auto rollback = exec_sql(db_, "ROLLBACK;"); !rollback.ok()) {
      return status.with_context("rollback failed (" + rollback.error() + ")");
    }
    return status;
  }
  return exec_sql(db_, "COMMIT;");
}

common::Result<std::vector<TranscriptEntry>>
TranscriptStore::load_session(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<TranscriptEntry>>::failure("transcript db not initialized");
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT session_id, turn_id, role, text, created_at FROM "
                         "transcript_entries WHERE session_id = ?1 ORDER BY id ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<TranscriptEntry>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<TranscriptEntry> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(TranscriptEntry{
        .session_id = column_text(stmt, 0),
        .turn_id = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1)),
        .role = column_text(stmt, 2),
        .text = column_text(stmt, 3),
        .created_at = column_text(stmt, 4),
    });
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<TranscriptEntry>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<TranscriptEntry>>::success(std::move(out));
}

common::Result<std::vector<std::string>> TranscriptStore::list_sessions() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<std::string>>::failure("transcript db not initialized");
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT session_id FROM transcript_entries GROUP BY session_id "
                         "ORDER BY MIN(id) ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<std::string>>::failure(sqlite3_errmsg(db_));
  }

  std::vector<std::string> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<std::string>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<std::string>>::success(std::move(out));
}

} // namespace voxrelay::transcripts

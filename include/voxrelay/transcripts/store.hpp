#pragma once

#include "voxrelay/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace voxrelay::transcripts {

struct TranscriptEntry {
  std::string session_id;
  std::uint64_t turn_id = 0;
  std::string role;
  std::string text;
  std::string created_at;
};

/// SQLite archive of committed turns. Shared by every session of a server, so all
/// statements run under one lock.
class TranscriptStore {
public:
  explicit TranscriptStore(std::filesystem::path db_path);
  ~TranscriptStore();

  TranscriptStore(const TranscriptStore &) = delete;
  TranscriptStore &operator=(const TranscriptStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::string &open_error() const { return open_error_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  /// Writes the user and assistant rows of one turn atomically.
  [[nodiscard]] common::Status record_turn(const std::string &session_id, std::uint64_t turn_id,
                                           const std::string &user_text,
                                           const std::string &assistant_text);
  [[nodiscard]] common::Result<std::vector<TranscriptEntry>>
  load_session(const std::string &session_id);
  [[nodiscard]] common::Result<std::vector<std::string>> list_sessions();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status insert_row(const std::string &session_id, std::uint64_t turn_id,
                                          const char *role, const std::string &text,
                                          const std::string &created_at);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace voxrelay::transcripts

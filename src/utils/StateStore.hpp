#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace gt::storage {

// One row of the schedules table. The target is kept as the JSON object the
// engine writes ({"hour":2,"min":30}); this layer does not interpret it.
struct PersistedSchedule {
  std::uint64_t entry_id = 0;
  std::string handler;
  std::string args;
  std::string target;
  bool repeat = false;
  bool needs_recompute = false;
  std::int64_t updated_at = 0;
};

class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);

  std::vector<PersistedSchedule> load_schedules() const;
  std::optional<PersistedSchedule> load_schedule(std::uint64_t entry_id) const;
  bool upsert_schedule(PersistedSchedule const &schedule);
  bool delete_schedule(std::uint64_t entry_id);

  std::optional<int> schema_version() const;

private:
  bool ensure_schema();
  bool execute(std::string const &sql) const;
  bool run_migrations();
  bool ensure_schema_version_row() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace gt::storage

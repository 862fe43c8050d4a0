#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

namespace gt::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto *text =
        reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    return text != nullptr ? std::string(text) : std::string();
}

PersistedSchedule read_schedule_row(sqlite3_stmt *stmt)
{
    PersistedSchedule row;
    row.entry_id = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
    row.handler = column_text(stmt, 1);
    row.args = column_text(stmt, 2);
    row.target = column_text(stmt, 3);
    row.repeat = sqlite3_column_int(stmt, 4) != 0;
    row.needs_recompute = sqlite3_column_int(stmt, 5) != 0;
    row.updated_at = sqlite3_column_int64(stmt, 6);
    return row;
}

std::int64_t unix_now()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

constexpr char const *kScheduleColumns =
    "entry_id, handler, args, target, repeat, needs_recompute, updated_at";

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            GT_LOG_WARN("cannot create {}: {}", parent.string(), ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        GT_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        GT_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            GT_LOG_ERROR("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            GT_LOG_ERROR("schema migration v{} failed", migration.version);
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kSchedulesSql =
        "CREATE TABLE IF NOT EXISTS schedules ("
        "entry_id INTEGER PRIMARY KEY,"
        "handler TEXT NOT NULL,"
        "args TEXT NOT NULL DEFAULT '',"
        "target TEXT NOT NULL,"
        "repeat INTEGER NOT NULL DEFAULT 0,"
        "needs_recompute INTEGER NOT NULL DEFAULT 0,"
        "updated_at INTEGER NOT NULL DEFAULT 0);";
    return execute(kSettingsSql) && execute(kSchedulesSql);
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        GT_LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        value = column_text(stmt, 0);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

std::vector<PersistedSchedule> Database::load_schedules() const
{
    std::vector<PersistedSchedule> result;
    if (!db_)
    {
        return result;
    }
    static std::string const sql = std::string("SELECT ") + kScheduleColumns +
                                   " FROM schedules ORDER BY entry_id;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        auto row = read_schedule_row(stmt);
        if (row.entry_id != 0 && !row.handler.empty())
        {
            result.push_back(std::move(row));
        }
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

std::optional<PersistedSchedule>
Database::load_schedule(std::uint64_t entry_id) const
{
    if (!db_)
    {
        return std::nullopt;
    }
    static std::string const sql = std::string("SELECT ") + kScheduleColumns +
                                   " FROM schedules WHERE entry_id = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(entry_id));
    std::optional<PersistedSchedule> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = read_schedule_row(stmt);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

bool Database::upsert_schedule(PersistedSchedule const &schedule)
{
    if (!db_ || schedule.entry_id == 0)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schedules (entry_id, handler, args, target, "
        "repeat, needs_recompute, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    auto const updated_at =
        schedule.updated_at != 0 ? schedule.updated_at : unix_now();
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(schedule.entry_id));
    sqlite3_bind_text(stmt, 2, schedule.handler.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, schedule.args.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, schedule.target.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, schedule.repeat ? 1 : 0);
    sqlite3_bind_int(stmt, 6, schedule.needs_recompute ? 1 : 0);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(updated_at));
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc != SQLITE_DONE)
    {
        GT_LOG_ERROR("failed to store schedule {}: {}", schedule.entry_id,
                     sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool Database::delete_schedule(std::uint64_t entry_id)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql = "DELETE FROM schedules WHERE entry_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(entry_id));
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

} // namespace gt::storage

#pragma once

#include "engine/ScheduleStore.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gt::storage
{
class Database;
}

namespace gt::engine
{

// Schedule checkpoints and daemon settings in a SQLite database, with an
// in-memory copy of the checkpoints for lookups.
class PersistenceManager final : public ScheduleStore
{
  public:
    explicit PersistenceManager(std::filesystem::path path);
    ~PersistenceManager() override;

    PersistenceManager(PersistenceManager const &) = delete;
    PersistenceManager &operator=(PersistenceManager const &) = delete;

    bool is_valid() const noexcept;

    bool save(ScheduleState const &state) override;
    std::optional<ScheduleState> load(EntryId entry_id) const override;
    std::vector<ScheduleState> load_all() const override;
    bool remove(EntryId entry_id) override;

    std::optional<std::string> get_setting(std::string const &key) const;
    bool set_setting(std::string const &key, std::string const &value);

  private:
    void load_cache();

    std::shared_ptr<storage::Database> database_;
    // Serialises statement use on the shared connection.
    mutable std::mutex db_mutex_;

    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<EntryId, ScheduleState> schedules_;
};

// {"hour":2,"min":30}, in the order the units were named.
std::string serialize_target(PartialTimeSpec const &target);
// Unknown units and malformed documents yield std::nullopt.
std::optional<PartialTimeSpec> deserialize_target(std::string const &payload);

} // namespace gt::engine

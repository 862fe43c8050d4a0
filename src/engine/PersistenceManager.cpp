#include "engine/PersistenceManager.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <yyjson.h>

namespace
{

gt::storage::PersistedSchedule to_row(gt::engine::ScheduleState const &state)
{
    gt::storage::PersistedSchedule row;
    row.entry_id = state.entry_id;
    row.handler = state.handler;
    row.args = state.args;
    row.target = gt::engine::serialize_target(state.target);
    row.repeat = state.repeat;
    row.needs_recompute = state.needs_recompute;
    return row;
}

std::optional<gt::engine::ScheduleState>
from_row(gt::storage::PersistedSchedule const &row)
{
    auto target = gt::engine::deserialize_target(row.target);
    if (!target)
    {
        GT_LOG_WARN("schedule {} has an unreadable target {}; skipped",
                    row.entry_id, row.target);
        return std::nullopt;
    }
    gt::engine::ScheduleState state;
    state.entry_id = row.entry_id;
    state.handler = row.handler;
    state.args = row.args;
    state.target = std::move(*target);
    state.repeat = row.repeat;
    state.needs_recompute = row.needs_recompute;
    return state;
}

} // namespace

namespace gt::engine
{

std::string serialize_target(PartialTimeSpec const &target)
{
    gt::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    for (auto const &[unit, value] : target.fields())
    {
        auto name = unit_name(unit);
        yyjson_mut_obj_add(root,
                           yyjson_mut_strncpy(native, name.data(), name.size()),
                           yyjson_mut_sint(native, value));
    }
    return doc.write("{}");
}

std::optional<PartialTimeSpec> deserialize_target(std::string const &payload)
{
    auto doc = gt::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        return std::nullopt;
    }
    PartialTimeSpec target;
    size_t idx, limit;
    yyjson_val *key = nullptr;
    yyjson_val *value = nullptr;
    yyjson_obj_foreach(root, idx, limit, key, value)
    {
        auto unit = find_unit(yyjson_get_str(key));
        if (!unit || !yyjson_is_int(value) || yyjson_get_sint(value) < 0)
        {
            return std::nullopt;
        }
        target.set(*unit, yyjson_get_sint(value));
    }
    return target;
}

PersistenceManager::PersistenceManager(std::filesystem::path path)
    : database_(std::make_shared<storage::Database>(std::move(path)))
{
    if (is_valid())
    {
        load_cache();
    }
}

PersistenceManager::~PersistenceManager() = default;

bool PersistenceManager::is_valid() const noexcept
{
    return database_ != nullptr && database_->is_valid();
}

void PersistenceManager::load_cache()
{
    std::vector<storage::PersistedSchedule> rows;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        rows = database_->load_schedules();
    }

    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    schedules_.clear();
    for (auto const &row : rows)
    {
        if (auto state = from_row(row))
        {
            schedules_[state->entry_id] = std::move(*state);
        }
    }
    GT_LOG_DEBUG("loaded {} schedule checkpoints", schedules_.size());
}

bool PersistenceManager::save(ScheduleState const &state)
{
    if (!is_valid() || state.entry_id == 0)
    {
        return false;
    }
    bool stored = false;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        stored = database_->upsert_schedule(to_row(state));
    }
    if (!stored)
    {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    schedules_[state.entry_id] = state;
    return true;
}

std::optional<ScheduleState> PersistenceManager::load(EntryId entry_id) const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = schedules_.find(entry_id);
    if (it == schedules_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ScheduleState> PersistenceManager::load_all() const
{
    std::vector<ScheduleState> result;
    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        result.reserve(schedules_.size());
        for (auto const &entry : schedules_)
        {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(),
              [](ScheduleState const &lhs, ScheduleState const &rhs)
              { return lhs.entry_id < rhs.entry_id; });
    return result;
}

bool PersistenceManager::remove(EntryId entry_id)
{
    if (!is_valid())
    {
        return false;
    }
    bool removed = false;
    {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        removed = database_->delete_schedule(entry_id);
    }
    if (removed)
    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        schedules_.erase(entry_id);
    }
    return removed;
}

std::optional<std::string>
PersistenceManager::get_setting(std::string const &key) const
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return database_->get_setting(key);
}

bool PersistenceManager::set_setting(std::string const &key,
                                     std::string const &value)
{
    if (!is_valid())
    {
        return false;
    }
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return database_->set_setting(key, value);
}

} // namespace gt::engine

#pragma once

#include "engine/TimeConverter.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gt::engine
{

using EntryId = std::uint64_t;

// Everything needed to re-derive a scheduled entry after a restart. The
// handler is referenced by its registered name, never by a live closure.
struct ScheduleState
{
    EntryId entry_id = 0;
    std::string handler;
    std::string args;
    PartialTimeSpec target;
    bool repeat = false;
    // Set when the host suspends; the delay must be recomputed against the
    // live clock before the entry is armed again.
    bool needs_recompute = false;

    bool operator==(ScheduleState const &other) const = default;
};

// Checkpoint store used at suspend/resume boundaries. Failures are reported
// through the return values.
class ScheduleStore
{
  public:
    virtual ~ScheduleStore() = default;

    virtual bool save(ScheduleState const &state) = 0;
    virtual std::optional<ScheduleState> load(EntryId entry_id) const = 0;
    virtual std::vector<ScheduleState> load_all() const = 0;
    virtual bool remove(EntryId entry_id) = 0;
};

} // namespace gt::engine

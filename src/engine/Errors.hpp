#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace gt::engine
{

// Invalid unit table, speed factor or configuration file. Fatal at startup.
class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class UnknownUnitError : public std::runtime_error
{
  public:
    explicit UnknownUnitError(std::string unit)
        : std::runtime_error("unknown game time unit: " + unit),
          unit_(std::move(unit))
    {
    }

    std::string const &unit() const noexcept { return unit_; }

  private:
    std::string unit_;
};

class InvalidTargetError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

class UnknownHandlerError : public std::runtime_error
{
  public:
    explicit UnknownHandlerError(std::string const &handler)
        : std::runtime_error("no handler registered as " + handler)
    {
    }
};

// Raised out of a timer fire when the scheduled handler threw; the handler's
// exception is nested inside.
class CallbackError : public std::runtime_error
{
  public:
    CallbackError(std::uint64_t entry_id, std::string const &what)
        : std::runtime_error(what), entry_id_(entry_id)
    {
    }

    std::uint64_t entry_id() const noexcept { return entry_id_; }

  private:
    std::uint64_t entry_id_ = 0;
};

} // namespace gt::engine

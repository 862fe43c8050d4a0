#pragma once

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gt::engine
{

// Named handlers that scheduled entries refer to. Handlers have to be
// registered again by the host after a restart, before on_resume().
class HandlerRegistry
{
  public:
    using Handler = std::function<void(std::string const &args)>;

    // Replaces a handler already registered under the same name.
    void add(std::string name, Handler handler);
    bool remove(std::string const &name);

    bool contains(std::string const &name) const;
    // Empty function when the name is unknown.
    Handler find(std::string const &name) const;
    std::vector<std::string> names() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace gt::engine

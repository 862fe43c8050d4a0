#include "engine/HandlerRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace gt::engine
{

void HandlerRegistry::add(std::string name, Handler handler)
{
    std::unique_lock lock(mutex_);
    handlers_[std::move(name)] = std::move(handler);
}

bool HandlerRegistry::remove(std::string const &name)
{
    std::unique_lock lock(mutex_);
    return handlers_.erase(name) > 0;
}

bool HandlerRegistry::contains(std::string const &name) const
{
    std::shared_lock lock(mutex_);
    return handlers_.find(name) != handlers_.end();
}

auto HandlerRegistry::find(std::string const &name) const -> Handler
{
    std::shared_lock lock(mutex_);
    auto it = handlers_.find(name);
    if (it == handlers_.end())
    {
        return {};
    }
    return it->second;
}

std::vector<std::string> HandlerRegistry::names() const
{
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(handlers_.size());
        for (auto const &entry : handlers_)
        {
            result.push_back(entry.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace gt::engine

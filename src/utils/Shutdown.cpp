#include "utils/Shutdown.hpp"

#include <atomic>

namespace gt::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};
std::atomic_bool g_reload_requested{false};
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

void request_reload() noexcept {
  g_reload_requested.store(true, std::memory_order_relaxed);
}

bool take_reload_request() noexcept {
  return g_reload_requested.exchange(false, std::memory_order_relaxed);
}

} // namespace gt::runtime

#pragma once

#include <atomic>

namespace gt::runtime
{

// Set from signal handlers; polled by the daemon loop.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// A reload suspends and resumes the scheduler without exiting.
void request_reload() noexcept;
bool take_reload_request() noexcept;

} // namespace gt::runtime

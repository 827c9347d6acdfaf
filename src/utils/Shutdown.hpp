#pragma once

#include <chrono>

namespace rcs::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Routes SIGINT and SIGTERM to request_shutdown().
void install_shutdown_signal_handlers();

// Sleeps in small steps until shutdown is requested or the timeout passes.
// Returns true when shutdown was requested.
bool wait_for_shutdown(std::chrono::milliseconds timeout);

} // namespace rcs::runtime

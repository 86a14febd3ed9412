// ============================================================================
// log.cpp -- quiet flag for the logging macros
// ============================================================================
#include "log.hpp"

#include <atomic>

namespace gzrotate::log {

static std::atomic<bool> g_quiet{false};

void set_quiet(bool quiet) noexcept {
  g_quiet.store(quiet, std::memory_order_relaxed);
}

bool quiet() noexcept {
  return g_quiet.load(std::memory_order_relaxed);
}

} // namespace gzrotate::log

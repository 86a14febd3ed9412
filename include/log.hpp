// ============================================================================
// log.hpp -- stderr logging for gzrotate
//
// Every component logs to stderr with a short tag ("ROT:", "READ:", ...);
// stdout is left alone. INFO lines are suppressed in quiet mode, warnings and
// errors always print.
// ============================================================================
#pragma once
#include <cstdio>

namespace gzrotate::log {

/// Suppress INFO output process-wide.
void set_quiet(bool quiet) noexcept;
bool quiet() noexcept;

} // namespace gzrotate::log

#define GZROT_INFO(...) do{ \
  if(!::gzrotate::log::quiet()){ std::fprintf(stderr, __VA_ARGS__); } \
}while(0)

#define GZROT_WARN(...) do{ \
  std::fprintf(stderr, "WARN: "); std::fprintf(stderr, __VA_ARGS__); \
}while(0)

#define GZROT_ERROR(...) do{ \
  std::fprintf(stderr, "ERROR: "); std::fprintf(stderr, __VA_ARGS__); \
}while(0)

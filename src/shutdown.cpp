// ============================================================================
// shutdown.cpp -- implementation of the ShutdownCoordinator class
// ============================================================================
#include "shutdown.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <pthread.h>

#include "log.hpp"

namespace gzrotate {

static sigset_t termination_set() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

ShutdownCoordinator::ShutdownCoordinator(CancellationToken& token)
: token_(token) {
  sigset_t set = termination_set();
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

ShutdownCoordinator::~ShutdownCoordinator() { stop(); }

void ShutdownCoordinator::start() {
  if (run_.exchange(true)) return;
  th_ = std::thread([this]{ loop(); });
}

void ShutdownCoordinator::stop() {
  if (!run_.exchange(false)) return;
  if (th_.joinable()) th_.join();
}

void ShutdownCoordinator::loop() {
  const sigset_t set = termination_set();
  const timespec poll{0, 100 * 1000 * 1000};   // 100 ms

  while (run_.load(std::memory_order_relaxed)) {
    siginfo_t info{};
    const int sig = sigtimedwait(&set, &info, &poll);
    if (sig < 0) continue;   // EAGAIN (timeout) or EINTR

    const int n = signals_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (n == 1) {
      GZROT_WARN("SIG: Received signal: %s. Initiating graceful shutdown...\n",
                 strsignal(sig));
      GZROT_WARN("SIG: Send the signal again to force exit "
                 "(will lose unprocessed data).\n");
      token_.request_stop();
    } else {
      GZROT_ERROR("SIG: Received second signal. Forcing exit.\n");
      std::_Exit(1);
    }
  }
}

} // namespace gzrotate

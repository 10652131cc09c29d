#include "CrashHandler.hpp"

#include "core/Log.hpp"
#include <backward.hpp>

namespace CrashHandler {

// Leaked on purpose: the handlers must outlive every static destructor.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (s_SignalHandler) {
    return;
  }
  s_SignalHandler = new backward::SignalHandling();
  if (!s_SignalHandler->loaded()) {
    LOG_WARN("Crash handler could not install signal handlers");
  }
}

} // namespace CrashHandler

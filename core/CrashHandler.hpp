#pragma once

namespace CrashHandler {

// Installs backward-cpp's signal handlers so fatal signals print a stack
// trace. Safe to call more than once.
void Init();

} // namespace CrashHandler

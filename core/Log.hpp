#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Log {

// Creates the shared logger with a colored console sink and a file sink
// written to `fileName` (truncated on every run).
void Init(const char *fileName = "mirrorstep.log");
void Shutdown();

// Adjusts the console verbosity. The file sink always records everything.
void SetConsoleLevel(spdlog::level::level_enum level);

std::shared_ptr<spdlog::logger> &GetLogger();

} // namespace Log

#define LOG_TRACE(...) ::Log::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::Log::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::Log::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Log::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Log::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Log::GetLogger()->critical(__VA_ARGS__)

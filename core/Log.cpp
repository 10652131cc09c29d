#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;
static spdlog::sink_ptr s_ConsoleSink;

void Init(const char *fileName) {
  if (s_Logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  s_ConsoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  s_ConsoleSink->set_pattern("%^[%T] %n: %v%$");
  s_ConsoleSink->set_level(spdlog::level::info);
  sinks.push_back(s_ConsoleSink);

  auto fileSink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(fileName, true);
  fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
  fileSink->set_level(spdlog::level::trace);
  sinks.push_back(fileSink);

  s_Logger = std::make_shared<spdlog::logger>("MIRRORSTEP", sinks.begin(),
                                              sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(spdlog::level::trace);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logging initialized ({})", fileName);
}

void Shutdown() {
  if (s_Logger) {
    s_Logger->flush();
  }
  spdlog::shutdown();
  s_Logger.reset();
  s_ConsoleSink.reset();
}

void SetConsoleLevel(const spdlog::level::level_enum level) {
  if (s_ConsoleSink) {
    s_ConsoleSink->set_level(level);
  }
}

std::shared_ptr<spdlog::logger> &GetLogger() { return s_Logger; }

} // namespace Log

#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sbu::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("sbu");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  // warn and above reach stdout immediately
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

void Logger::shutdown() {
  if (!_bInitialized) return;
  spdlog::default_logger()->flush();
  spdlog::drop_all();
  spdlog::shutdown();
  _bInitialized = false;
}

}  // namespace sbu::common

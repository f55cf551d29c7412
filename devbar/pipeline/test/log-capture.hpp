#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

#include "devbar/log.hpp"

namespace devbar::test {

// Redirects the default logger to memory, at debug level, for the lifetime of the object.
class LogCapture {
 public:
  LogCapture()
      : _previous(log::default_logger()),
        _logger(std::make_shared<spdlog::logger>("devbar-test",
                                                 std::make_shared<spdlog::sinks::ostream_sink_st>(_stream))) {
    _logger->set_level(log::level::debug);
    _logger->set_pattern("%l %v");
    log::set_default_logger(_logger);
  }

  LogCapture(const LogCapture &) = delete;
  LogCapture(LogCapture &&) noexcept = delete;
  LogCapture &operator=(const LogCapture &) = delete;
  LogCapture &operator=(LogCapture &&) noexcept = delete;

  ~LogCapture() { log::set_default_logger(_previous); }

  [[nodiscard]] std::string contents() const {
    _logger->flush();
    return _stream.str();
  }

 private:
  std::ostringstream _stream;
  std::shared_ptr<spdlog::logger> _previous;
  std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace devbar::test

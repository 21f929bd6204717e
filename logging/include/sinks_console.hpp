#pragma once
#include "log.hpp"
#include <mutex>
#include <ostream>

namespace trs::log {

// One line per record: "<utc time> [LEVEL] APP/CTX: message (file:line)"
class ConsoleSink : public ISink {
public:
  ConsoleSink();
  explicit ConsoleSink(std::ostream& out) : out_(out) {}

  void write(const LogRecord& r) noexcept override;

private:
  std::mutex mu_;
  std::ostream& out_;
};

} // namespace trs::log

#pragma once
#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace trs::log {

// Forwards records to the COVESA DLT daemon. The application is registered
// under the record's app id on first use and one DLT context is registered per
// ctx_id. Only built when libdlt is available (TRS_HAVE_DLT).
class DltSink : public ISink {
public:
  explicit DltSink(std::string app_description = "Task result store");
  ~DltSink() override;

  DltSink(const DltSink&) = delete;
  DltSink& operator=(const DltSink&) = delete;

  void write(const LogRecord& r) noexcept override;

private:
  struct Context;   // wraps DltContext so dlt headers stay out of this header

  Context* ContextFor_(const std::string& app_id, const std::string& ctx_id);

  std::mutex mu_;
  std::string app_desc_;
  std::string registered_app_id_;
  std::unordered_map<std::string, std::unique_ptr<Context>> contexts_;
};

} // namespace trs::log

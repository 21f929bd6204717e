#include "sinks_dlt.hpp"
#include <dlt/dlt_user.h>
#include <exception>
#include <string>

namespace trs::log {

struct DltSink::Context {
  DltContext handle{};
};

namespace {

DltLogLevelType ToDltLevel(LogLevel l) {
  switch (l) {
    case LogLevel::kFatal:   return DLT_LOG_FATAL;
    case LogLevel::kError:   return DLT_LOG_ERROR;
    case LogLevel::kWarn:    return DLT_LOG_WARN;
    case LogLevel::kInfo:    return DLT_LOG_INFO;
    case LogLevel::kDebug:   return DLT_LOG_DEBUG;
    case LogLevel::kVerbose: return DLT_LOG_VERBOSE;
    default:                 return DLT_LOG_OFF;
  }
}

} // namespace

DltSink::DltSink(std::string app_description)
  : app_desc_(std::move(app_description)) {}

DltSink::~DltSink() {
  std::scoped_lock lk(mu_);
  for (auto& [id, ctx] : contexts_) dlt_unregister_context(&ctx->handle);
  contexts_.clear();
  if (!registered_app_id_.empty()) dlt_unregister_app();
}

// DLT allows one application per process; a changed app id re-registers it.
DltSink::Context* DltSink::ContextFor_(const std::string& app_id, const std::string& ctx_id) {
  if (registered_app_id_ != app_id) {
    for (auto& [id, ctx] : contexts_) dlt_unregister_context(&ctx->handle);
    contexts_.clear();
    if (!registered_app_id_.empty()) dlt_unregister_app();
    if (dlt_register_app(app_id.c_str(), app_desc_.c_str()) < 0) {
      registered_app_id_.clear();
      return nullptr;
    }
    registered_app_id_ = app_id;
  }

  auto it = contexts_.find(ctx_id);
  if (it != contexts_.end()) return it->second.get();

  auto ctx = std::make_unique<Context>();
  if (dlt_register_context(&ctx->handle, ctx_id.c_str(), ctx_id.c_str()) < 0) return nullptr;
  return contexts_.emplace(ctx_id, std::move(ctx)).first->second.get();
}

void DltSink::write(const LogRecord& r) noexcept {
  try {
    std::scoped_lock lk(mu_);
    Context* ctx = ContextFor_(r.app_id, r.ctx_id);
    if (ctx == nullptr) return;

    if (r.file) {
      const std::string where = std::string(r.file) + ":" + std::to_string(r.line);
      DLT_LOG(ctx->handle, ToDltLevel(r.level), DLT_STRING(r.message.c_str()), DLT_STRING(where.c_str()));
    } else {
      DLT_LOG(ctx->handle, ToDltLevel(r.level), DLT_STRING(r.message.c_str()));
    }
  } catch (const std::exception&) {
    // allocation failure while formatting; the record is dropped
  }
}

} // namespace trs::log

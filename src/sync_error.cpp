#include "sync_error.hpp"

#include <cpptrace/cpptrace.hpp>

#include <stdexcept>

#include "log.hpp"

namespace docsync {

namespace {

class SyncCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "docsync"; }

  std::string message(int value) const override {
    switch(static_cast<sync_errc>(value)) {
      case sync_errc::invalid_argument: return "Invalid arguments";
      case sync_errc::container_unavailable:
        return "Container unavailable: invalid identifier, store unreachable or permission denied";
      case sync_errc::not_found: return "The item does not exist";
      case sync_errc::stalled_transfer: return "Transfer stalled: no progress within the idle window of any attempt";
      case sync_errc::query_timeout: return "Metadata query timed out";
      case sync_errc::store_error: return "Store error";
      case sync_errc::read_error: return "Read failed";
      case sync_errc::canceled: return "Operation canceled";
      case sync_errc::malformed_metadata: return "Malformed metadata record";
      case sync_errc::internal: return "Internal error";
    }
    return "Unknown docsync error";
  }
};

} // namespace

const std::error_category& sync_category() noexcept {
  static const SyncCategory category;
  return category;
}

std::error_code make_error_code(sync_errc e) noexcept {
  return {static_cast<int>(e), sync_category()};
}

const char* error_tag(const std::error_code& code) noexcept {
  if(!code) return "OK";
  if(code.category() != sync_category()) return "E_NAT";
  switch(static_cast<sync_errc>(code.value())) {
    case sync_errc::invalid_argument: return "E_ARG";
    case sync_errc::container_unavailable: return "E_CTR";
    case sync_errc::not_found: return "E_FNF";
    case sync_errc::stalled_transfer: return "E_STALLED";
    case sync_errc::query_timeout: return "E_TIMEOUT";
    case sync_errc::store_error: return "E_NAT";
    case sync_errc::read_error: return "E_READ";
    case sync_errc::canceled: return "E_CANCEL";
    case sync_errc::malformed_metadata: return "E_MALFORMED";
    case sync_errc::internal: return "E_PLUGIN_INTERNAL";
  }
  return "E_NAT";
}

std::string SyncError::message() const {
  if(!code) return "ok";
  if(detail.empty()) return code.message();
  return code.message() + ": " + detail;
}

SyncError wrap_store_error(const std::string& what) {
  return SyncError(sync_errc::store_error, what);
}

SyncError wrap_store_error(const std::error_code& ec, const std::string& context) {
  if(context.empty()) return SyncError(sync_errc::store_error, ec.message());
  return SyncError(sync_errc::store_error, context + ": " + ec.message());
}

void invariant_violation(const std::string& what, Logger* logger) {
  log_error(logger, "invariant violated: {}", what);
#ifndef NDEBUG
  cpptrace::generate_trace().print();
  throw std::logic_error("docsync invariant violated: " + what);
#endif
}

} // namespace docsync

#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace docsync {

class Logger;

enum class sync_errc {
  invalid_argument = 1,
  container_unavailable,
  not_found,
  stalled_transfer,
  query_timeout,
  store_error,
  read_error,
  canceled,
  malformed_metadata,
  internal
};

const std::error_category& sync_category() noexcept;
std::error_code make_error_code(sync_errc e) noexcept;

// Short wire tag for an error ("E_FNF", "E_TIMEOUT", ...). Codes outside the
// docsync category map to "E_NAT".
const char* error_tag(const std::error_code& code) noexcept;

struct SyncError {
  std::error_code code;
  std::string detail;

  SyncError() = default;
  SyncError(std::error_code c, std::string d = {}) : code(c), detail(std::move(d)) {}
  SyncError(sync_errc e, std::string d = {}) : code(make_error_code(e)), detail(std::move(d)) {}

  explicit operator bool() const { return static_cast<bool>(code); }
  bool is(sync_errc e) const { return code == make_error_code(e); }

  std::string message() const;
};

// Opaque failure from the store substrate, original text preserved.
SyncError wrap_store_error(const std::string& what);
SyncError wrap_store_error(const std::error_code& ec, const std::string& context);

// Reports a broken internal invariant. Always logged; debug builds also print
// a stack trace and throw std::logic_error.
void invariant_violation(const std::string& what, Logger* logger = nullptr);

} // namespace docsync

namespace std {
template<>
struct is_error_code_enum<docsync::sync_errc> : true_type {};
} // namespace std

#pragma once
#include <string>
#include <utility>
#include <variant>

namespace sgw {

enum class ErrorKind {
  MalformedRequest,
  InvalidCapability,
  ObjectNotFound,
  UnsatisfiableRange,
  ClientDisconnected,
  UpstreamFetchFailure,
  InternalFault
};

struct GatewayError {
  ErrorKind   kind;
  std::string message;
};

// HTTP status a request-level failure maps to. ClientDisconnected has no status
// (nothing is written back); it maps to 0.
int http_status_for(ErrorKind kind);
const char* error_kind_name(ErrorKind kind);

// Value-or-error return used at component boundaries.
template <typename T>
class Result {
public:
  Result(T value) : v_(std::move(value)) {}
  Result(GatewayError err) : v_(std::move(err)) {}

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  T&       value()       { return std::get<T>(v_); }
  const T& value() const { return std::get<T>(v_); }
  const GatewayError& error() const { return std::get<GatewayError>(v_); }

  T*       operator->()       { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, GatewayError> v_;
};

inline GatewayError make_error(ErrorKind kind, std::string message) {
  return GatewayError{kind, std::move(message)};
}

} // namespace sgw

#include "Result.hpp"

namespace sgw {

int http_status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedRequest:     return 400;
    case ErrorKind::InvalidCapability:    return 403;
    case ErrorKind::ObjectNotFound:       return 404;
    case ErrorKind::UnsatisfiableRange:   return 416;
    case ErrorKind::ClientDisconnected:   return 0;
    case ErrorKind::UpstreamFetchFailure: return 500;
    case ErrorKind::InternalFault:        return 500;
  }
  return 500;
}

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedRequest:     return "MalformedRequest";
    case ErrorKind::InvalidCapability:    return "InvalidCapability";
    case ErrorKind::ObjectNotFound:       return "ObjectNotFound";
    case ErrorKind::UnsatisfiableRange:   return "UnsatisfiableRange";
    case ErrorKind::ClientDisconnected:   return "ClientDisconnected";
    case ErrorKind::UpstreamFetchFailure: return "UpstreamFetchFailure";
    case ErrorKind::InternalFault:        return "InternalFault";
  }
  return "Unknown";
}

} // namespace sgw

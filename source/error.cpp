#include "packwerk/error.hpp"

namespace packwerk {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Conversion:   return "conversion";
    case ErrorKind::Backend:      return "backend";
    case ErrorKind::Verification: return "verification";
    case ErrorKind::Crypto:       return "crypto";
    case ErrorKind::Format:       return "format";
    case ErrorKind::Internal:     return "internal";
  }
  return "unknown";
}

Error::Error(ErrorKind kind, const std::string& what)
  : std::runtime_error(std::string(error_kind_name(kind)) + " error: " + what),
    kind_(kind) {}

std::string describe(std::exception_ptr e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace packwerk

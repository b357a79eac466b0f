#include "hfpull/errors.hpp"

namespace hfpull {

std::string toString(ListErrorKind kind) {
  switch (kind) {
  case ListErrorKind::NotFound:
    return "not found";
  case ListErrorKind::Malformed:
    return "malformed listing";
  case ListErrorKind::Network:
    return "network error";
  default:
    return "unknown";
  }
}

std::string toString(TransferErrorKind kind) {
  switch (kind) {
  case TransferErrorKind::HttpStatus:
    return "http status";
  case TransferErrorKind::Transport:
    return "transport error";
  case TransferErrorKind::Filesystem:
    return "filesystem error";
  default:
    return "unknown";
  }
}

} // namespace hfpull

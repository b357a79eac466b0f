#ifndef HFPULL_ERRORS_HPP
#define HFPULL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace hfpull {

// Raised by the HTTP layer when a request fails below the HTTP level
// (DNS, connect, TLS, timeout, connection reset).
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class ListErrorKind { NotFound, Malformed, Network };

class ListError : public std::runtime_error {
public:
  ListError(ListErrorKind kind, const std::string &message,
            long httpStatus = 0)
      : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus) {}

  ListErrorKind kind() const { return kind_; }
  long httpStatus() const { return httpStatus_; }

private:
  ListErrorKind kind_;
  long httpStatus_;
};

enum class TransferErrorKind { HttpStatus, Transport, Filesystem };

class TransferError : public std::runtime_error {
public:
  TransferError(TransferErrorKind kind, const std::string &message,
                long httpStatus = 0)
      : std::runtime_error(message), kind_(kind), httpStatus_(httpStatus) {}

  TransferErrorKind kind() const { return kind_; }
  // Only meaningful for TransferErrorKind::HttpStatus.
  long httpStatus() const { return httpStatus_; }

private:
  TransferErrorKind kind_;
  long httpStatus_;
};

std::string toString(ListErrorKind kind);
std::string toString(TransferErrorKind kind);

} // namespace hfpull

#endif // HFPULL_ERRORS_HPP

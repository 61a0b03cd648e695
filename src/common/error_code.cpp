#include "common/error_code.hpp"
#include <string>
#include <string_view>

namespace x328 {

std::string_view ToString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kFramingError:
      return "framing error";
    case ErrorCode::kChecksumError:
      return "checksum error";
    case ErrorCode::kInvalidDigit:
      return "invalid digit";
    case ErrorCode::kInvalidAddress:
      return "invalid address";
    case ErrorCode::kInvalidParameter:
      return "invalid parameter";
    case ErrorCode::kValueOutOfRange:
      return "value out of range";
    case ErrorCode::kBufferOverflow:
      return "buffer overflow";
    case ErrorCode::kSequenceError:
      return "sequence error";
    case ErrorCode::kTimedOut:
      return "timed out";
    case ErrorCode::kNak:
      return "rejected by peer";
    case ErrorCode::kTransportError:
      return "transport error";
  }
  return "unknown error";
}

#if X328_STD_ERROR_CODE
namespace {

class X328ErrorCategory : public std::error_category {
 public:
  [[nodiscard]] char const *name() const noexcept override { return "x328"; }

  [[nodiscard]] std::string message(int condition) const override {
    return std::string{ToString(static_cast<ErrorCode>(condition))};
  }
};

}  // namespace

std::error_category const &ErrorCategory() noexcept {
  static X328ErrorCategory const kCategory;
  return kCategory;
}
#endif

}  // namespace x328

#pragma once

#include <cstdint>
#include <string_view>

#if X328_STD_ERROR_CODE
#include <system_error>
#include <type_traits>
#endif

namespace x328 {

/**
 * @brief Every error kind the protocol engine and its adapters can report
 *
 * Errors are always returned as values (inside Result<T> or as event payloads), never thrown.
 */
enum class ErrorCode : uint8_t {
  /** Unexpected control byte or malformed structural sequence */
  kFramingError = 1,
  /** Received BCC does not match the frame body */
  kChecksumError,
  /** A byte in a digit field is not an ASCII decimal digit */
  kInvalidDigit,
  /** Station address outside [0, 99] */
  kInvalidAddress,
  /** Parameter number outside [0, 999] */
  kInvalidParameter,
  /** Value does not fit the sign + 5 digit wire field */
  kValueOutOfRange,
  /** Frame would exceed the maximum frame length, or destination buffer too small */
  kBufferOverflow,
  /** API used out of order by the host */
  kSequenceError,
  /** Host signalled a timeout */
  kTimedOut,
  /** Explicit rejection by the peer */
  kNak,
  /** Transport read/write failed (I/O adapters only) */
  kTransportError
};

[[nodiscard]] std::string_view ToString(ErrorCode code) noexcept;

#if X328_STD_ERROR_CODE
[[nodiscard]] std::error_category const &ErrorCategory() noexcept;

[[nodiscard]] inline std::error_code make_error_code(ErrorCode code) noexcept {
  return {static_cast<int>(code), ErrorCategory()};
}
#endif

}  // namespace x328

#if X328_STD_ERROR_CODE
namespace std {
template <>
struct is_error_code_enum<x328::ErrorCode> : true_type {};
}  // namespace std
#endif

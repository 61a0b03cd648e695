#pragma once

#include "../common/parameter.hpp"
#include "../common/result.hpp"

namespace x328 {

/**
 * @brief Application logic behind a slave station
 *
 * SlavePort calls these for requests addressed to its station. Returning
 * ErrorCode::kInvalidParameter answers the master with "invalid parameter" (EOT); any other
 * error answers NAK.
 */
class ParameterHandler {
 public:
  virtual ~ParameterHandler() = default;

  [[nodiscard]] virtual Result<ParameterValue> OnRead(ParameterNumber parameter) = 0;

  [[nodiscard]] virtual Result<void> OnWrite(ParameterNumber parameter, ParameterValue value) = 0;

  /**
   * @brief The master polled this station
   * @return true to acknowledge, false to answer NAK
   */
  [[nodiscard]] virtual bool OnSelect() { return true; }
};

}  // namespace x328

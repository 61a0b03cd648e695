#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include "../common/parameter.hpp"
#include "../common/result.hpp"
#include "parameter_handler.hpp"

namespace x328 {

/**
 * @brief In-memory parameter store for a slave station
 *
 * Only parameters that were added exist; reading or writing any other number fails with
 * ErrorCode::kInvalidParameter. Writing a read-only parameter fails with ErrorCode::kNak.
 */
class ParameterTable : public ParameterHandler {
 public:
  /**
   * @brief Add count consecutive parameters starting at first, initialized to 0
   *
   * Parameters that already exist keep their value. The range is cut off at 999.
   */
  void AddParameters(ParameterNumber first, uint16_t count);

  void RemoveParameters(ParameterNumber first, uint16_t count);

  /**
   * @brief Store a value, bypassing the read-only flag
   * @return ErrorCode::kInvalidParameter if the parameter does not exist
   */
  [[nodiscard]] Result<void> Set(ParameterNumber parameter, ParameterValue value);

  [[nodiscard]] std::optional<ParameterValue> Get(ParameterNumber parameter) const;

  [[nodiscard]] bool Contains(ParameterNumber parameter) const { return values_.contains(parameter.Value()); }

  [[nodiscard]] size_t Size() const noexcept { return values_.size(); }

  /**
   * @brief Reject writes from the bus to this parameter
   */
  void SetReadOnly(ParameterNumber parameter, bool read_only = true);

  // ParameterHandler interface
  [[nodiscard]] Result<ParameterValue> OnRead(ParameterNumber parameter) override;
  [[nodiscard]] Result<void> OnWrite(ParameterNumber parameter, ParameterValue value) override;

 private:
  std::unordered_map<uint16_t, ParameterValue> values_{};
  std::unordered_set<uint16_t> read_only_{};
};

}  // namespace x328

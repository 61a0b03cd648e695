#include <algorithm>
#include <cstdint>
#include <optional>
#include "io/parameter_table.hpp"

namespace x328 {

namespace {

uint16_t RangeEnd(ParameterNumber first, uint16_t count) {
  return static_cast<uint16_t>(std::min<uint32_t>(uint32_t{first.Value()} + count, ParameterNumber::kMax + 1U));
}

}  // namespace

void ParameterTable::AddParameters(ParameterNumber first, uint16_t count) {
  uint16_t const end = RangeEnd(first, count);
  for (uint16_t i = first.Value(); i < end; ++i) {
    if (!values_.contains(i)) {
      values_[i] = ParameterValue{};
    }
  }
}

void ParameterTable::RemoveParameters(ParameterNumber first, uint16_t count) {
  uint16_t const end = RangeEnd(first, count);
  for (uint16_t i = first.Value(); i < end; ++i) {
    values_.erase(i);
    read_only_.erase(i);
  }
}

Result<void> ParameterTable::Set(ParameterNumber parameter, ParameterValue value) {
  auto it = values_.find(parameter.Value());
  if (it == values_.end()) {
    return ErrorCode::kInvalidParameter;
  }
  it->second = value;
  return {};
}

std::optional<ParameterValue> ParameterTable::Get(ParameterNumber parameter) const {
  auto it = values_.find(parameter.Value());
  if (it == values_.end()) {
    return {};
  }
  return it->second;
}

void ParameterTable::SetReadOnly(ParameterNumber parameter, bool read_only) {
  if (read_only) {
    read_only_.insert(parameter.Value());
  } else {
    read_only_.erase(parameter.Value());
  }
}

Result<ParameterValue> ParameterTable::OnRead(ParameterNumber parameter) {
  auto value = Get(parameter);
  if (!value.has_value()) {
    return ErrorCode::kInvalidParameter;
  }
  return *value;
}

Result<void> ParameterTable::OnWrite(ParameterNumber parameter, ParameterValue value) {
  if (!Contains(parameter)) {
    return ErrorCode::kInvalidParameter;
  }
  if (read_only_.contains(parameter.Value())) {
    return ErrorCode::kNak;
  }
  return Set(parameter, value);
}

}  // namespace x328

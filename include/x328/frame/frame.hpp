#pragma once

#include <cstdint>
#include <variant>
#include "../common/parameter.hpp"
#include "../common/station_address.hpp"

namespace x328 {

/**
 * @brief Why a node rejected a command
 */
enum class NakReason : uint8_t {
  /** NAK: the command could not be carried out */
  kCommandFailed,
  /** EOT in reply position: the parameter does not exist on the node */
  kInvalidParameter
};

/** Master asks a node for the value of a parameter */
struct ReadRequest {
  StationAddress address;
  ParameterNumber parameter;

  friend bool operator==(ReadRequest const &, ReadRequest const &) = default;
};

/** Master asks a node to change a parameter */
struct WriteRequest {
  StationAddress address;
  ParameterNumber parameter;
  ParameterValue value;

  friend bool operator==(WriteRequest const &, WriteRequest const &) = default;
};

/** Node answers a read request */
struct ReadResponse {
  ParameterValue value;

  friend bool operator==(ReadResponse const &, ReadResponse const &) = default;
};

/** Node accepted a write request or a select sequence */
struct WriteAck {
  friend bool operator==(WriteAck const &, WriteAck const &) = default;
};

/** Node rejected the command */
struct Nak {
  NakReason reason{NakReason::kCommandFailed};

  friend bool operator==(Nak const &, Nak const &) = default;
};

/** Master polls a station for presence */
struct SelectSequence {
  StationAddress address;

  friend bool operator==(SelectSequence const &, SelectSequence const &) = default;
};

/**
 * @brief Any X3.28 frame
 *
 * A Frame is only ever produced from validated field types or by a successful parse, so every
 * alternative satisfies the range invariants of its fields.
 */
using Frame = std::variant<ReadRequest, WriteRequest, ReadResponse, WriteAck, Nak, SelectSequence>;

}  // namespace x328

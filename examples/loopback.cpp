/**
 * @file loopback.cpp
 * @brief Master and slave exchanging frames through memory
 *
 * The master side uses the sans-IO Master directly: the bytes it produces are handed to a
 * SlavePort over a MemoryTransport and the answer is fed back. Run with SPDLOG_LEVEL=trace to see
 * the bytes.
 */

#include <cstdint>
#include <iostream>
#include <span>
#include <variant>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include "x328/common/error_code.hpp"
#include "x328/common/parameter.hpp"
#include "x328/common/station_address.hpp"
#include "x328/io/parameter_table.hpp"
#include "x328/io/slave_port.hpp"
#include "x328/master/master.hpp"
#include "x328/transport/memory_transport.hpp"

namespace {

using x328::FrameBuffer;
using x328::Master;
using x328::MasterEvent;
using x328::MemoryTransport;
using x328::Result;
using x328::SlavePort;

// Deliver a request to the slave and feed its answer to the master
void Exchange(Master &master, Result<FrameBuffer> const &request, SlavePort &slave, MemoryTransport &line) {
  if (!request) {
    std::cout << "  request rejected: " << x328::ToString(request.Error()) << "\n";
    return;
  }

  line.ClearWriteBuffer();
  line.SetReadData(request.Value().Bytes());
  auto served = slave.Poll(line);
  if (!served) {
    std::cout << "  slave failed: " << x328::ToString(served.Error()) << "\n";
    return;
  }

  auto event = master.Feed(line.GetWrittenData());
  if (!event) {
    std::cout << "  master failed: " << x328::ToString(event.Error()) << "\n";
    return;
  }

  MasterEvent const &outcome = event.Value();
  if (auto const *read = std::get_if<x328::ReadCompleted>(&outcome)) {
    std::cout << "  value " << read->value.Value() << "\n";
  } else if (std::holds_alternative<x328::WriteAcked>(outcome)) {
    std::cout << "  write acknowledged\n";
  } else if (std::holds_alternative<x328::SelectAcked>(outcome)) {
    std::cout << "  station present\n";
  } else if (auto const *nakd = std::get_if<x328::Nakd>(&outcome)) {
    std::cout << "  rejected ("
              << (nakd->reason == x328::NakReason::kInvalidParameter ? "invalid parameter" : "command failed")
              << ")\n";
  } else if (auto const *error = std::get_if<x328::ProtocolError>(&outcome)) {
    std::cout << "  protocol error: " << x328::ToString(error->code) << "\n";
  } else {
    std::cout << "  no answer\n";
    master.NotifyTimeout();
  }
}

}  // namespace

int main() {
  spdlog::cfg::load_env_levels();

  x328::ParameterTable table;
  table.AddParameters(x328::ParameterNumber::Create(0).Value(), 20);
  table.SetReadOnly(x328::ParameterNumber::Create(3).Value());

  MemoryTransport line;
  SlavePort slave(x328::StationAddress::Create(12).Value(), table);
  Master master;

  std::cout << "=== X3.28 master/slave loopback, station 12 ===\n\n";

  std::cout << "Select station 12\n";
  Exchange(master, master.StartSelect(12), slave, line);

  std::cout << "Write parameter 5 = -1234\n";
  Exchange(master, master.StartWrite(12, 5, -1234), slave, line);

  std::cout << "Read parameter 5\n";
  Exchange(master, master.StartRead(12, 5), slave, line);

  std::cout << "Write read-only parameter 3\n";
  Exchange(master, master.StartWrite(12, 3, 1), slave, line);

  std::cout << "Read missing parameter 500\n";
  Exchange(master, master.StartRead(12, 500), slave, line);

  std::cout << "Read parameter 5 of station 13\n";
  Exchange(master, master.StartRead(13, 5), slave, line);

  std::cout << "Write out of range value\n";
  Exchange(master, master.StartWrite(12, 5, 100000), slave, line);

  return 0;
}

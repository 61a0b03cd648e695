/**
 * @file slave_echo.cpp
 * @brief X3.28 node serving an in-memory parameter table on a serial port
 *
 * Usage: x328_slave_echo [-v|-vv] [port] [address] [baud]
 *
 * Parameters 0..99 exist and start at 0; writes are stored and read back. Parameter 3 is
 * read-only, parameters from 100 up answer "invalid parameter".
 */

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include "serial_transport.hpp"
#include "x328/common/error_code.hpp"
#include "x328/common/parameter.hpp"
#include "x328/common/station_address.hpp"
#include "x328/io/parameter_table.hpp"
#include "x328/io/slave_port.hpp"

int main(int argc, char *argv[]) {
  using x328::ParameterNumber;
  using x328::ParameterTable;
  using x328::SlavePort;
  using x328::StationAddress;

  spdlog::set_default_logger(spdlog::stderr_color_mt("x328"));
  spdlog::set_level(spdlog::level::info);
  spdlog::cfg::load_env_levels();

  std::string port = "/dev/ttyUSB0";
  int address = 10;
  x328::SerialSettings settings;
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-v") {
      spdlog::set_level(spdlog::level::debug);
    } else if (arg == "-vv") {
      spdlog::set_level(spdlog::level::trace);
    } else if (positional == 0) {
      port = arg;
      ++positional;
    } else if (positional == 1) {
      address = std::atoi(arg.c_str());
      ++positional;
    } else if (positional == 2) {
      settings.baud_rate = std::atoi(arg.c_str());
      ++positional;
    }
  }

  auto station = StationAddress::Create(address);
  if (!station) {
    spdlog::error("bad station address {}: {}", address, x328::ToString(station.Error()));
    return 1;
  }

  ParameterTable table;
  table.AddParameters(ParameterNumber::Create(0).Value(), 100);
  table.SetReadOnly(ParameterNumber::Create(3).Value());

  x328::SerialTransport transport(port, settings);
  if (!transport.IsOpen()) {
    return 1;
  }

  SlavePort slave(station.Value(), table);
  spdlog::info("station {} listening on {}", address, port);

  while (true) {
    auto served = slave.Poll(transport);
    if (!served) {
      spdlog::error("stopping: {}", x328::ToString(served.Error()));
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

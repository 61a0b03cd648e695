/**
 * @file x328_repl.cpp
 * @brief Interactive X3.28 bus controller on a serial port
 *
 * Usage: x328_repl [-v|-vv] [port] [baud]
 *
 * Commands:
 *   read <address> <parameter>                 (or: r)
 *   write <address> <parameter> <value>        (or: w)
 *   poll <address> <parameter> <seconds>       read repeatedly until enter is pressed
 *   select <address>                           presence poll
 *   quit
 *
 * Log level follows SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=trace shows every byte on the line).
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include "serial_transport.hpp"
#include "x328/common/error_code.hpp"
#include "x328/frame/frame.hpp"
#include "x328/io/blocking_master.hpp"

namespace {

using x328::BlockingMaster;
using x328::ErrorCode;

void PrintError(BlockingMaster const &master, ErrorCode error) {
  if (error == ErrorCode::kNak && master.LastNakReason() == x328::NakReason::kInvalidParameter) {
    std::cout << "error: invalid parameter\n";
    return;
  }
  std::cout << "error: " << x328::ToString(error) << "\n";
}

bool ReadOnce(BlockingMaster &master, int address, int parameter) {
  auto value = master.ReadParameter(address, parameter);
  if (!value) {
    PrintError(master, value.Error());
    return false;
  }
  std::cout << value.Value().Value() << "\n";
  return true;
}

void CmdRead(std::istringstream &args, BlockingMaster &master) {
  int address = 0;
  int parameter = 0;
  if (!(args >> address >> parameter)) {
    std::cout << "usage: read <address> <parameter>\n";
    return;
  }
  ReadOnce(master, address, parameter);
}

void CmdWrite(std::istringstream &args, BlockingMaster &master) {
  int address = 0;
  int parameter = 0;
  int64_t value = 0;
  if (!(args >> address >> parameter >> value)) {
    std::cout << "usage: write <address> <parameter> <value>\n";
    return;
  }
  auto result = master.WriteParameter(address, parameter, value);
  if (!result) {
    PrintError(master, result.Error());
    return;
  }
  std::cout << "ok\n";
}

void CmdPoll(std::istringstream &args, BlockingMaster &master) {
  int address = 0;
  int parameter = 0;
  double seconds = 0.0;
  if (!(args >> address >> parameter >> seconds) || seconds <= 0.0) {
    std::cout << "usage: poll <address> <parameter> <seconds>\n";
    return;
  }

  std::cout << "Press enter to stop polling.\n";
  if (!ReadOnce(master, address, parameter)) {
    return;
  }

  std::atomic<bool> stop{false};
  std::thread waiter([&stop] {
    std::string line;
    std::getline(std::cin, line);
    stop = true;
  });

  auto const period = std::chrono::duration<double>(seconds);
  while (!stop) {
    auto const next = std::chrono::steady_clock::now() + period;
    while (!stop && std::chrono::steady_clock::now() < next) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!stop && !ReadOnce(master, address, parameter)) {
      break;
    }
  }
  if (!stop) {
    std::cout << "Polling stopped, press enter to continue.\n";
  }
  waiter.join();
}

void CmdSelect(std::istringstream &args, BlockingMaster &master) {
  int address = 0;
  if (!(args >> address)) {
    std::cout << "usage: select <address>\n";
    return;
  }
  auto result = master.Select(address);
  if (!result) {
    PrintError(master, result.Error());
    return;
  }
  std::cout << "station " << address << " present\n";
}

}  // namespace

int main(int argc, char *argv[]) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("x328"));
  spdlog::cfg::load_env_levels();

  std::string port = "/dev/ttyACM0";
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
      settings.baud_rate = std::atoi(arg.c_str());
      ++positional;
    }
  }

  x328::SerialTransport transport(port, settings);
  if (!transport.IsOpen()) {
    return 1;
  }
  BlockingMaster master(transport);

  std::string line;
  while (true) {
    std::cout << ">> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    std::istringstream args(line);
    std::string cmd;
    if (!(args >> cmd)) {
      continue;
    }

    if (cmd == "read" || cmd == "r") {
      CmdRead(args, master);
    } else if (cmd == "write" || cmd == "w") {
      CmdWrite(args, master);
    } else if (cmd == "poll") {
      CmdPoll(args, master);
    } else if (cmd == "select") {
      CmdSelect(args, master);
    } else if (cmd == "quit" || cmd == "exit") {
      break;
    } else {
      std::cout << "Unknown command " << cmd << "\n";
    }
  }
  return 0;
}

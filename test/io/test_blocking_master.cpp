#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <span>
#include <vector>
#include "x328/common/error_code.hpp"
#include "x328/io/blocking_master.hpp"
#include "x328/transport/memory_transport.hpp"

using x328::BlockingMaster;
using x328::ErrorCode;
using x328::MasterOutcome;
using x328::MasterState;
using x328::MemoryTransport;
using x328::NakReason;
using x328::ParameterValue;

namespace {

constexpr std::chrono::milliseconds kShortTimeout{20};

std::vector<uint8_t> Written(MemoryTransport const &transport) {
  auto data = transport.GetWrittenData();
  return {data.begin(), data.end()};
}

class BrokenTransport : public MemoryTransport {
 public:
  [[nodiscard]] int Read(std::span<uint8_t> /*buffer*/) override { return -1; }
};

}  // namespace

TEST(BlockingMaster, ReadParameter) {
  MemoryTransport transport;
  std::vector<uint8_t> answer{0x02, '+', '5', '6', 0x03, 0x2B};
  transport.SetReadData(answer);
  BlockingMaster master(transport);

  auto result = master.ReadParameter(12, 5);
  ASSERT_TRUE(result.HasValue()) << x328::ToString(result.Error());
  EXPECT_EQ(result.Value().Value(), 56);
  EXPECT_EQ(Written(transport), (std::vector<uint8_t>{0x02, '1', '2', '0', '0', '5', 0x03, 0x35}));
  EXPECT_EQ(master.GetMaster().LastOutcome(), MasterOutcome::kCompleted);
  EXPECT_FALSE(master.LastNakReason().has_value());
}

TEST(BlockingMaster, WriteParameter) {
  MemoryTransport transport;
  std::vector<uint8_t> ack{0x06};
  transport.SetReadData(ack);
  BlockingMaster master(transport);

  auto result = master.WriteParameter(1, 10, -7);
  ASSERT_TRUE(result.HasValue()) << x328::ToString(result.Error());
  EXPECT_EQ(Written(transport), (std::vector<uint8_t>{0x02, '0', '1', '0', '1', '0', '-', '7', 0x03, 0x29}));
}

TEST(BlockingMaster, Select) {
  MemoryTransport transport;
  std::vector<uint8_t> ack{0x06};
  transport.SetReadData(ack);
  BlockingMaster master(transport);

  EXPECT_TRUE(master.Select(9).HasValue());
  EXPECT_EQ(Written(transport), (std::vector<uint8_t>{0x04, '0', '9', 0x05}));
}

TEST(BlockingMaster, NakReasons) {
  MemoryTransport transport;
  BlockingMaster master(transport);

  std::vector<uint8_t> nak{0x15};
  transport.SetReadData(nak);
  auto failed = master.WriteParameter(12, 5, 1);
  ASSERT_FALSE(failed.HasValue());
  EXPECT_EQ(failed.Error(), ErrorCode::kNak);
  ASSERT_TRUE(master.LastNakReason().has_value());
  EXPECT_EQ(*master.LastNakReason(), NakReason::kCommandFailed);
  EXPECT_EQ(master.GetMaster().LastOutcome(), MasterOutcome::kNakd);

  std::vector<uint8_t> eot{0x04};
  transport.SetReadData(eot);
  auto invalid = master.ReadParameter(12, 999);
  ASSERT_FALSE(invalid.HasValue());
  EXPECT_EQ(invalid.Error(), ErrorCode::kNak);
  EXPECT_EQ(master.LastNakReason(), NakReason::kInvalidParameter);

  // A successful transaction clears the reason
  std::vector<uint8_t> ack{0x06};
  transport.SetReadData(ack);
  ASSERT_TRUE(master.Select(12).HasValue());
  EXPECT_FALSE(master.LastNakReason().has_value());
}

TEST(BlockingMaster, TimesOutWithoutAnswer) {
  MemoryTransport transport;
  BlockingMaster master(transport, {}, kShortTimeout);

  auto result = master.ReadParameter(12, 5);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error(), ErrorCode::kTimedOut);
  EXPECT_EQ(master.GetMaster().LastOutcome(), MasterOutcome::kTimedOut);
  EXPECT_EQ(master.GetMaster().GetState(), MasterState::kIdle);
}

TEST(BlockingMaster, TimesOutOnIncompleteAnswer) {
  MemoryTransport transport;
  std::vector<uint8_t> partial{0x02, '+', '5'};
  transport.SetReadData(partial);
  BlockingMaster master(transport, {}, kShortTimeout);

  auto result = master.ReadParameter(12, 5);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error(), ErrorCode::kTimedOut);

  // The next transaction starts from a clean parser
  std::vector<uint8_t> ack{0x06};
  transport.SetReadData(ack);
  EXPECT_TRUE(master.WriteParameter(12, 5, 0).HasValue());
}

TEST(BlockingMaster, CorruptedAnswer) {
  MemoryTransport transport;
  std::vector<uint8_t> answer{0x02, '+', '5', '6', 0x03, 0x2C};
  transport.SetReadData(answer);
  BlockingMaster master(transport);

  auto result = master.ReadParameter(12, 5);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error(), ErrorCode::kChecksumError);
  EXPECT_EQ(master.GetMaster().LastOutcome(), MasterOutcome::kProtocolError);
}

TEST(BlockingMaster, AnswerOfWrongKind) {
  MemoryTransport transport;
  std::vector<uint8_t> ack{0x06};
  transport.SetReadData(ack);
  BlockingMaster master(transport);

  auto result = master.ReadParameter(12, 5);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error(), ErrorCode::kFramingError);
}

TEST(BlockingMaster, RangeErrorsSendNothing) {
  MemoryTransport transport;
  BlockingMaster master(transport);

  EXPECT_EQ(master.ReadParameter(100, 5).Error(), ErrorCode::kInvalidAddress);
  EXPECT_EQ(master.ReadParameter(12, 1000).Error(), ErrorCode::kInvalidParameter);
  EXPECT_EQ(master.WriteParameter(12, 5, 100000).Error(), ErrorCode::kValueOutOfRange);
  EXPECT_EQ(master.Select(-1).Error(), ErrorCode::kInvalidAddress);
  EXPECT_TRUE(transport.GetWrittenData().empty());
  EXPECT_EQ(master.GetMaster().GetState(), MasterState::kIdle);
}

TEST(BlockingMaster, ShortWrite) {
  MemoryTransport transport;
  transport.SetWriteLimit(4);
  BlockingMaster master(transport);

  auto result = master.ReadParameter(12, 5);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error(), ErrorCode::kTransportError);
  EXPECT_EQ(master.GetMaster().GetState(), MasterState::kIdle);
}

TEST(BlockingMaster, ReadFailure) {
  BrokenTransport transport;
  BlockingMaster master(transport);

  auto result = master.Select(3);
  ASSERT_FALSE(result.HasValue());
  EXPECT_EQ(result.Error(), ErrorCode::kTransportError);
  EXPECT_EQ(master.GetMaster().GetState(), MasterState::kIdle);
}

TEST(BlockingMaster, Timeout) {
  MemoryTransport transport;
  BlockingMaster master(transport);
  EXPECT_EQ(master.GetTimeout(), BlockingMaster::kDefaultTimeout);

  master.SetTimeout(kShortTimeout);
  EXPECT_EQ(master.GetTimeout(), kShortTimeout);
}

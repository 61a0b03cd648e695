#include <gtest/gtest.h>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include "x328/common/error_code.hpp"
#include "x328/common/wire_format_options.hpp"
#include "x328/frame/frame.hpp"
#include "x328/frame/frame_encoder.hpp"
#include "x328/frame/frame_parser.hpp"

using x328::BccMode;
using x328::ErrorCode;
using x328::Frame;
using x328::FrameEncoder;
using x328::FrameParser;
using x328::Nak;
using x328::NakReason;
using x328::NeedMoreData;
using x328::ParameterNumber;
using x328::ParameterValue;
using x328::ParseError;
using x328::ParseEvent;
using x328::ParserPhase;
using x328::ParserRole;
using x328::ReadRequest;
using x328::ReadResponse;
using x328::SelectSequence;
using x328::StationAddress;
using x328::WireFormatOptions;
using x328::WriteAck;
using x328::WriteRequest;

namespace {

StationAddress Addr(int value) { return StationAddress::Create(value).Value(); }
ParameterNumber Param(int value) { return ParameterNumber::Create(value).Value(); }
ParameterValue Val(int value) { return ParameterValue::Create(value).Value(); }

// Feed everything and collect every event other than NeedMoreData
std::vector<ParseEvent> FeedAll(FrameParser &parser, std::span<uint8_t const> data) {
  std::vector<ParseEvent> events;
  while (!data.empty()) {
    auto result = parser.Feed(data);
    data = data.subspan(result.consumed);
    if (!std::holds_alternative<NeedMoreData>(result.event)) {
      events.push_back(result.event);
    }
  }
  return events;
}

std::vector<uint8_t> const kReadStation12Param5{0x02, 0x31, 0x32, 0x30, 0x30, 0x35, 0x03, 0x35};

}  // namespace

TEST(FrameParser, ParsesReadRequest) {
  FrameParser parser(ParserRole::kCommand);
  auto result = parser.Feed(kReadStation12Param5);

  EXPECT_EQ(result.consumed, kReadStation12Param5.size());
  ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
  EXPECT_EQ(std::get<Frame>(result.event), (Frame{ReadRequest{Addr(12), Param(5)}}));
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kIdle);
}

TEST(FrameParser, ParsesWriteRequest) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, '0', '1', '0', '1', '0', '-', '7', 0x03, 0x29};
  auto result = parser.Feed(data);

  EXPECT_EQ(result.consumed, data.size());
  ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
  EXPECT_EQ(std::get<Frame>(result.event), (Frame{WriteRequest{Addr(1), Param(10), Val(-7)}}));
}

TEST(FrameParser, ParsesReadResponse) {
  FrameParser parser(ParserRole::kResponse);
  std::vector<uint8_t> data{0x02, '+', '5', '6', 0x03, 0x2B};
  auto result = parser.Feed(data);

  ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
  EXPECT_EQ(std::get<Frame>(result.event), Frame{ReadResponse{Val(56)}});
}

TEST(FrameParser, ChecksumThatLooksLikeControlByte) {
  // BCC of "-128" ETX is 0x15, the NAK byte
  FrameParser parser(ParserRole::kResponse);
  std::vector<uint8_t> data{0x02, '-', '1', '2', '8', 0x03, 0x15};
  auto result = parser.Feed(data);

  EXPECT_EQ(result.consumed, data.size());
  ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
  EXPECT_EQ(std::get<Frame>(result.event), Frame{ReadResponse{Val(-128)}});
}

TEST(FrameParser, SingleByteAnswers) {
  FrameParser parser(ParserRole::kResponse);
  std::vector<uint8_t> data{0x06, 0x15, 0x04};
  auto events = FeedAll(parser, data);

  ASSERT_EQ(events.size(), 3U);
  EXPECT_EQ(std::get<Frame>(events[0]), Frame{WriteAck{}});
  EXPECT_EQ(std::get<Frame>(events[1]), Frame{Nak{NakReason::kCommandFailed}});
  EXPECT_EQ(std::get<Frame>(events[2]), Frame{Nak{NakReason::kInvalidParameter}});
}

TEST(FrameParser, SelectSequenceInCommandRole) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x04, '0', '7', 0x05};
  auto result = parser.Feed(data);

  EXPECT_EQ(result.consumed, 4U);
  ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
  EXPECT_EQ(std::get<Frame>(result.event), Frame{SelectSequence{Addr(7)}});
}

TEST(FrameParser, LoneEotInCommandRoleIsDropped) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x04};
  data.insert(data.end(), kReadStation12Param5.begin(), kReadStation12Param5.end());

  auto events = FeedAll(parser, data);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(std::get<Frame>(events[0]), (Frame{ReadRequest{Addr(12), Param(5)}}));
}

TEST(FrameParser, ByteAtATime) {
  FrameParser parser(ParserRole::kCommand);
  for (size_t i = 0; i + 1 < kReadStation12Param5.size(); ++i) {
    auto result = parser.Feed(std::span<uint8_t const>(&kReadStation12Param5[i], 1));
    EXPECT_EQ(result.consumed, 1U);
    EXPECT_TRUE(std::holds_alternative<NeedMoreData>(result.event)) << "byte " << i;
  }
  auto last = parser.Feed(std::span<uint8_t const>(&kReadStation12Param5.back(), 1));
  ASSERT_TRUE(std::holds_alternative<Frame>(last.event));
  EXPECT_EQ(std::get<Frame>(last.event), (Frame{ReadRequest{Addr(12), Param(5)}}));
}

TEST(FrameParser, StopsAfterFirstFrame) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data = kReadStation12Param5;
  data.insert(data.end(), kReadStation12Param5.begin(), kReadStation12Param5.end());

  auto first = parser.Feed(data);
  EXPECT_EQ(first.consumed, kReadStation12Param5.size());
  EXPECT_TRUE(std::holds_alternative<Frame>(first.event));

  auto second = parser.Feed(std::span<uint8_t const>(data).subspan(first.consumed));
  EXPECT_EQ(second.consumed, kReadStation12Param5.size());
  EXPECT_TRUE(std::holds_alternative<Frame>(second.event));
}

TEST(FrameParser, PhasesAndPartialAddress) {
  FrameParser parser(ParserRole::kCommand);
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kIdle);

  std::vector<uint8_t> stx{0x02};
  (void)parser.Feed(stx);
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kExpectingAddress);
  EXPECT_FALSE(parser.GetAddress().has_value());

  std::vector<uint8_t> address{'4', '2'};
  (void)parser.Feed(address);
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kExpectingParameter);
  ASSERT_TRUE(parser.GetAddress().has_value());
  EXPECT_EQ(parser.GetAddress()->Value(), 42);

  std::vector<uint8_t> parameter{'1', '0', '0'};
  (void)parser.Feed(parameter);
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kExpectingValueOrTerminator);

  std::vector<uint8_t> sign{'+'};
  (void)parser.Feed(sign);
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kExpectingValueDigits);

  parser.Reset();
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kIdle);
  EXPECT_FALSE(parser.GetAddress().has_value());

  auto result = parser.Feed(kReadStation12Param5);
  EXPECT_TRUE(std::holds_alternative<Frame>(result.event));
}

TEST(FrameParser, ChecksumErrorCarriesAddress) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data = kReadStation12Param5;
  data.back() = 0x36;

  auto result = parser.Feed(data);
  EXPECT_EQ(result.consumed, data.size());
  ASSERT_TRUE(std::holds_alternative<ParseError>(result.event));
  auto const &error = std::get<ParseError>(result.event);
  EXPECT_EQ(error.code, ErrorCode::kChecksumError);
  ASSERT_TRUE(error.address.has_value());
  EXPECT_EQ(error.address->Value(), 12);
}

TEST(FrameParser, InvalidDigitInAddress) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, '1', 'A', '0', '0', '5', 0x03, 0x35};

  auto events = FeedAll(parser, data);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(std::get<ParseError>(events[0]), (ParseError{ErrorCode::kInvalidDigit, std::nullopt}));
}

TEST(FrameParser, InvalidDigitInParameter) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, '1', '2', '0', 'x'};

  auto result = parser.Feed(data);
  EXPECT_EQ(result.consumed, data.size());
  EXPECT_EQ(std::get<ParseError>(result.event), (ParseError{ErrorCode::kInvalidDigit, Addr(12)}));
}

TEST(FrameParser, TooManyValueDigits) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, '1', '2', '0', '0', '5', '+', '1', '2', '3', '4', '5', '6'};

  auto result = parser.Feed(data);
  EXPECT_EQ(result.consumed, data.size());
  EXPECT_EQ(std::get<ParseError>(result.event), (ParseError{ErrorCode::kBufferOverflow, Addr(12)}));
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kDiscardingFrame);

  auto next = parser.Feed(kReadStation12Param5);
  EXPECT_TRUE(std::holds_alternative<Frame>(next.event));
}

TEST(FrameParser, SignWithoutDigits) {
  FrameParser parser(ParserRole::kResponse);
  std::vector<uint8_t> data{0x02, '+', 0x03};

  auto result = parser.Feed(data);
  EXPECT_EQ(result.consumed, 3U);
  EXPECT_EQ(std::get<ParseError>(result.event).code, ErrorCode::kFramingError);
}

TEST(FrameParser, UnexpectedControlByte) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, 0x03};

  auto result = parser.Feed(data);
  EXPECT_EQ(result.consumed, 2U);
  EXPECT_EQ(std::get<ParseError>(result.event).code, ErrorCode::kFramingError);
}

TEST(FrameParser, TruncatedFrameFollowedByGoodFrame) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, '1', '2', '0'};
  data.insert(data.end(), kReadStation12Param5.begin(), kReadStation12Param5.end());

  auto first = parser.Feed(data);
  EXPECT_EQ(first.consumed, 4U);  // the interrupting STX is left for the next frame
  EXPECT_EQ(std::get<ParseError>(first.event), (ParseError{ErrorCode::kFramingError, Addr(12)}));

  auto events = FeedAll(parser, std::span<uint8_t const>(data).subspan(first.consumed));
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(std::get<Frame>(events[0]), (Frame{ReadRequest{Addr(12), Param(5)}}));
}

TEST(FrameParser, NakInsideFrameBelongsToBrokenFrame) {
  FrameParser parser(ParserRole::kResponse);
  std::vector<uint8_t> data{0x02, '+', '1', 0x15, '2', 0x03, 0x2A, 0x02, '+', '5', '6', 0x03, 0x2B};

  auto events = FeedAll(parser, data);
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(std::get<ParseError>(events[0]).code, ErrorCode::kFramingError);
  EXPECT_EQ(std::get<Frame>(events[1]), Frame{ReadResponse{Val(56)}});
}

TEST(FrameParser, RestOfBrokenFrameIsSkipped) {
  // Write 12/005 +29 with its parameter digit garbled; the trailing BCC 0x15 is the NAK byte
  std::vector<uint8_t> data{0x02, '1', '2', '0', 'X', '5', '+', '2', '9', 0x03, 0x15};
  data.insert(data.end(), kReadStation12Param5.begin(), kReadStation12Param5.end());

  for (auto role : {ParserRole::kCommand, ParserRole::kResponse}) {
    FrameParser parser(role);
    auto events = FeedAll(parser, data);
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(std::get<ParseError>(events[0]), (ParseError{ErrorCode::kInvalidDigit, Addr(12)}));
    EXPECT_EQ(std::get<Frame>(events[1]), (Frame{ReadRequest{Addr(12), Param(5)}}));
    EXPECT_EQ(parser.GetPhase(), ParserPhase::kIdle);
  }
}

TEST(FrameParser, SkippingEndsAtChecksumAfterEtx) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> broken{0x02, '1', 'Y'};

  auto error = parser.Feed(broken);
  ASSERT_TRUE(std::holds_alternative<ParseError>(error.event));
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kDiscardingFrame);

  std::vector<uint8_t> tail{'0', 0x06, 0x03};
  auto skipped = parser.Feed(tail);
  EXPECT_TRUE(std::holds_alternative<NeedMoreData>(skipped.event));
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kDiscardingChecksum);

  // The BCC is dropped even when it looks like an answer byte
  std::vector<uint8_t> checksum{0x06};
  auto dropped = parser.Feed(checksum);
  EXPECT_TRUE(std::holds_alternative<NeedMoreData>(dropped.event));
  EXPECT_EQ(parser.GetPhase(), ParserPhase::kIdle);

  auto next = parser.Feed(checksum);
  ASSERT_TRUE(std::holds_alternative<Frame>(next.event));
  EXPECT_EQ(std::get<Frame>(next.event), Frame{WriteAck{}});
}

TEST(FrameParser, EotEndsSkippingEarly) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{0x02, '1', 'Y', '0', 0x04, '0', '7', 0x05};

  auto events = FeedAll(parser, data);
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(std::get<ParseError>(events[0]).code, ErrorCode::kInvalidDigit);
  EXPECT_EQ(std::get<Frame>(events[1]), Frame{SelectSequence{Addr(7)}});
}

TEST(FrameParser, NoiseBetweenFramesIsSkipped) {
  FrameParser parser(ParserRole::kCommand);
  std::vector<uint8_t> data{'x', 'y', 0x7F, '5', 0x03, 0x05};
  data.insert(data.end(), kReadStation12Param5.begin(), kReadStation12Param5.end());

  auto events = FeedAll(parser, data);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(std::get<Frame>(events[0]), (Frame{ReadRequest{Addr(12), Param(5)}}));
}

TEST(FrameParser, PrintableBccMode) {
  std::vector<uint8_t> data{0x02, '+', '0', 0x03, 0x38};

  FrameParser printable(ParserRole::kResponse, WireFormatOptions{BccMode::kPrintable});
  auto ok = printable.Feed(data);
  ASSERT_TRUE(std::holds_alternative<Frame>(ok.event));
  EXPECT_EQ(std::get<Frame>(ok.event), Frame{ReadResponse{Val(0)}});

  FrameParser plain(ParserRole::kResponse);
  auto bad = plain.Feed(data);
  ASSERT_TRUE(std::holds_alternative<ParseError>(bad.event));
  EXPECT_EQ(std::get<ParseError>(bad.event).code, ErrorCode::kChecksumError);
}

TEST(FrameParser, RoundTrip) {
  std::vector<Frame> const commands{
      ReadRequest{Addr(0), Param(0)},
      ReadRequest{Addr(99), Param(999)},
      WriteRequest{Addr(42), Param(17), Val(0)},
      WriteRequest{Addr(3), Param(250), Val(99999)},
      WriteRequest{Addr(3), Param(250), Val(-99999)},
      SelectSequence{Addr(55)},
  };
  std::vector<Frame> const answers{
      ReadResponse{Val(1)},
      ReadResponse{Val(-40000)},
      WriteAck{},
      Nak{NakReason::kCommandFailed},
      Nak{NakReason::kInvalidParameter},
  };

  for (auto mode : {BccMode::kPlain, BccMode::kPrintable}) {
    WireFormatOptions options{mode};
    FrameParser command_parser(ParserRole::kCommand, options);
    for (auto const &frame : commands) {
      auto encoded = FrameEncoder::Encode(frame, options);
      auto result = command_parser.Feed(encoded.Bytes());
      EXPECT_EQ(result.consumed, encoded.Size());
      ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
      EXPECT_EQ(std::get<Frame>(result.event), frame);
    }

    FrameParser response_parser(ParserRole::kResponse, options);
    for (auto const &frame : answers) {
      auto encoded = FrameEncoder::Encode(frame, options);
      auto result = response_parser.Feed(encoded.Bytes());
      EXPECT_EQ(result.consumed, encoded.Size());
      ASSERT_TRUE(std::holds_alternative<Frame>(result.event));
      EXPECT_EQ(std::get<Frame>(result.event), frame);
    }
  }
}

#include <gtest/gtest.h>
#include "logging.hpp"
#include "scripted_transport.hpp"
#include "transfer.hpp"

using namespace tftpc;
using namespace tftpc::fake;

namespace {

const Transport::endpoint kServer = loopback(69);
const Transport::endpoint kPeer = loopback(50001);
const Transport::endpoint kStranger = loopback(50002);

class TransferTest : public ::testing::Test {
protected:
  void SetUp() override {
    Logger::instance().set_level(LogLevel::OFF);
    opts.server = kServer;
  }

  static std::vector<uint8_t> concat(const std::vector<uint8_t> &a,
                                     const std::vector<uint8_t> &b) {
    std::vector<uint8_t> out(a);
    out.insert(out.end(), b.begin(), b.end());
    return out;
  }

  static std::vector<uint8_t> slice(const std::vector<uint8_t> &v, size_t from,
                                    size_t to) {
    return std::vector<uint8_t>(v.begin() + from, v.begin() + to);
  }

  ScriptedTransport net;
  TransferOptions opts;
};

} // namespace

// get

TEST_F(TransferTest, GetTwoChunks) {
  auto first = filled(512, 1);
  auto second = filled(300, 2);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(2, second), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("remote.bin", net, out, opts);
  ASSERT_FALSE(err.has_value()) << err->describe();
  EXPECT_EQ(out.size(), 812u);
  EXPECT_EQ(out, concat(first, second));

  ASSERT_EQ(net.sent().size(), 3u);
  EXPECT_EQ(net.sent()[0].datagram,
            encode_request(Opcode::ReadRequest, "remote.bin"));
  EXPECT_EQ(net.sent()[0].to, kServer);
  EXPECT_EQ(net.sent()[1].datagram, encode_ack(1));
  EXPECT_EQ(net.sent()[1].to, kPeer);
  EXPECT_EQ(net.sent()[2].datagram, encode_ack(2));
  EXPECT_EQ(net.sent()[2].to, kPeer);
}

TEST_F(TransferTest, GetExactMultipleNeedsEmptyTrailer) {
  auto first = filled(512, 9);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(2, std::vector<uint8_t>()), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(out, first);
  ASSERT_EQ(net.sent().size(), 3u);
  EXPECT_EQ(net.sent()[2].datagram, encode_ack(2));
}

TEST_F(TransferTest, GetEmptyFile) {
  net.reply(encode_data(1, std::vector<uint8_t>()), kPeer);
  std::vector<uint8_t> out = {1, 2, 3};
  auto err = get_file("empty", net, out, opts);
  ASSERT_FALSE(err.has_value());
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(net.sent().size(), 2u);
}

TEST_F(TransferTest, GetServerErrorFirst) {
  net.reply(raw_error(1, "file not found"), kPeer);
  std::vector<uint8_t> out;
  auto err = get_file("missing", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::FileNotFound);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(net.sent().size(), 1u);
}

TEST_F(TransferTest, GetErrorMidTransferDropsPartialData) {
  net.reply(encode_data(1, filled(512, 3)), kPeer);
  net.reply(raw_error(0, "disk on fire"), kPeer);
  std::vector<uint8_t> out = {42};
  ReadTransfer t(net, "f", opts);
  auto err = t.run(out);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::NotDefined);
  EXPECT_EQ(err->message, "disk on fire");
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(t.state(), ReadTransfer::State::Failed);
}

TEST_F(TransferTest, GetRejectsAckAsReply) {
  auto ack = encode_ack(1);
  net.reply(ack, kPeer);
  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, ack);
}

TEST_F(TransferTest, GetRejectsTruncatedData) {
  std::vector<uint8_t> bytes = {0, 3, 0};
  net.reply(bytes, kPeer);
  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, bytes);
  EXPECT_EQ(net.sent().size(), 1u);
}

TEST_F(TransferTest, GetRejectsOversizedData) {
  std::vector<uint8_t> bytes = encode_data(1, filled(512, 0));
  bytes.push_back(0x55);
  net.reply(bytes, kPeer);
  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw.size(), 517u);
}

TEST_F(TransferTest, GetRefusesNulInFilename) {
  std::vector<uint8_t> out;
  auto err = get_file(std::string("a\0b", 3), net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::IllegalOperation);
  EXPECT_TRUE(net.sent().empty());
}

TEST_F(TransferTest, GetReportsClosedTransport) {
  net.reply(encode_data(1, filled(512, 0)), kPeer);
  // script runs dry: the fake reports the socket as aborted
  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::Transport);
  EXPECT_EQ(err->ec, std::error_code(asio::error::operation_aborted));
  EXPECT_TRUE(out.empty());
}

TEST_F(TransferTest, GetReportsSendFailure) {
  net.fail_sends(std::make_error_code(std::errc::network_unreachable));
  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::Transport);
  EXPECT_EQ(err->ec, std::make_error_code(std::errc::network_unreachable));
}

TEST_F(TransferTest, GetRejectsUnknownTid) {
  auto first = filled(512, 4);
  auto second = filled(10, 5);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(2, filled(20, 6)), kStranger);
  net.reply(encode_data(2, second), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(out, concat(first, second));

  // RRQ, ACK 1, ERROR to the stranger, ACK 2
  ASSERT_EQ(net.sent().size(), 4u);
  EXPECT_EQ(net.sent()[2].to, kStranger);
  auto rejected = decode_error(net.sent()[2].datagram.data(),
                               net.sent()[2].datagram.size());
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->code, 5);
  EXPECT_EQ(net.sent()[3].to, kPeer);
}

TEST_F(TransferTest, GetRetransmitsRequestOnTimeout) {
  opts.timeout = std::chrono::milliseconds(50);
  net.fail_next_receive(asio::error::timed_out);
  net.reply(encode_data(1, filled(5, 0)), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_FALSE(err.has_value());
  ASSERT_EQ(net.sent().size(), 3u);
  EXPECT_EQ(net.sent()[0].datagram, net.sent()[1].datagram);
  EXPECT_EQ(net.sent()[1].to, kServer);
}

TEST_F(TransferTest, GetRetransmitsAckToPeer) {
  opts.timeout = std::chrono::milliseconds(50);
  net.reply(encode_data(1, filled(512, 0)), kPeer);
  net.fail_next_receive(asio::error::timed_out);
  net.reply(encode_data(2, filled(1, 0)), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_FALSE(err.has_value());
  ASSERT_EQ(net.sent().size(), 4u);
  EXPECT_EQ(net.sent()[2].datagram, encode_ack(1));
  EXPECT_EQ(net.sent()[2].to, kPeer);
  EXPECT_EQ(out.size(), 513u);
}

TEST_F(TransferTest, GetGivesUpAfterRetries) {
  opts.timeout = std::chrono::milliseconds(50);
  opts.retries = 2;
  for (int i = 0; i < 3; i++)
    net.fail_next_receive(asio::error::timed_out);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::Timeout);
  EXPECT_EQ(net.sent().size(), 3u);
}

TEST_F(TransferTest, GetLenientAcceptsAnyBlockNumber) {
  auto first = filled(512, 1);
  auto second = filled(7, 2);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(9, second), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(out.size(), 512u + 512u + 7u);
  EXPECT_EQ(net.sent().back().datagram, encode_ack(9));
}

TEST_F(TransferTest, GetStrictSkipsDuplicateBlock) {
  opts.strict_blocks = true;
  auto first = filled(512, 1);
  auto second = filled(7, 2);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(1, first), kPeer);
  net.reply(encode_data(2, second), kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(out, concat(first, second));
  // the duplicate is acknowledged again
  ASSERT_EQ(net.sent().size(), 4u);
  EXPECT_EQ(net.sent()[2].datagram, encode_ack(1));
}

TEST_F(TransferTest, GetStrictRejectsSkippedBlock) {
  opts.strict_blocks = true;
  net.reply(encode_data(1, filled(512, 1)), kPeer);
  auto bad = encode_data(3, filled(512, 1));
  net.reply(bad, kPeer);

  std::vector<uint8_t> out;
  auto err = get_file("f", net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, bad);
  EXPECT_TRUE(out.empty());
}

// put

TEST_F(TransferTest, PutSixHundredBytes) {
  auto data = filled(600, 7);
  net.reply(encode_ack(0), kPeer);
  net.reply(encode_ack(1), kPeer);
  net.reply(encode_ack(2), kPeer);

  WriteTransfer t(net, "upload.bin", data, opts);
  auto err = t.run();
  ASSERT_FALSE(err.has_value()) << err->describe();
  EXPECT_EQ(t.state(), WriteTransfer::State::Done);
  EXPECT_EQ(t.data_packets_sent(), 2u);
  EXPECT_EQ(net.pending(), 0u);

  ASSERT_EQ(net.sent().size(), 3u);
  EXPECT_EQ(net.sent()[0].datagram,
            encode_request(Opcode::WriteRequest, "upload.bin"));
  EXPECT_EQ(net.sent()[0].to, kServer);
  EXPECT_EQ(net.sent()[1].datagram, encode_data(1, slice(data, 0, 512)));
  EXPECT_EQ(net.sent()[1].to, kPeer);
  EXPECT_EQ(net.sent()[2].datagram, encode_data(2, slice(data, 512, 600)));
  EXPECT_EQ(net.sent()[2].datagram.size(), 4u + 88u);
}

TEST_F(TransferTest, PutEmptyFileSendsOneEmptyBlock) {
  std::vector<uint8_t> data;
  net.reply(encode_ack(0), kPeer);
  net.reply(encode_ack(1), kPeer);

  auto err = put_file("empty", data, net, opts);
  ASSERT_FALSE(err.has_value());
  ASSERT_EQ(net.sent().size(), 2u);
  std::vector<uint8_t> want = {0, 3, 0, 1};
  EXPECT_EQ(net.sent()[1].datagram, want);
}

TEST_F(TransferTest, PutExactMultipleSendsEmptyTrailer) {
  auto data = filled(1024, 3);
  for (uint16_t b = 0; b <= 3; b++)
    net.reply(encode_ack(b), kPeer);

  WriteTransfer t(net, "f", data, opts);
  auto err = t.run();
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(t.data_packets_sent(), 3u);
  ASSERT_EQ(net.sent().size(), 4u);
  EXPECT_EQ(net.sent()[1].datagram, encode_data(1, slice(data, 0, 512)));
  EXPECT_EQ(net.sent()[2].datagram, encode_data(2, slice(data, 512, 1024)));
  EXPECT_EQ(net.sent()[3].datagram, encode_data(3, std::vector<uint8_t>()));
}

TEST_F(TransferTest, PutDuplicateAckResendsCurrentChunk) {
  auto data = filled(700, 3);
  net.reply(encode_ack(0), kPeer);
  net.reply(encode_ack(0), kPeer); // duplicate, DATA 1 goes out again
  net.reply(encode_ack(1), kPeer);
  net.reply(encode_ack(2), kPeer);

  std::vector<uint8_t> copy = data;
  auto err = put_file("f", data, net, opts);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(data, copy);
  ASSERT_EQ(net.sent().size(), 4u);
  EXPECT_EQ(net.sent()[1].datagram, net.sent()[2].datagram);
  EXPECT_EQ(net.sent()[3].datagram, encode_data(2, slice(data, 512, 700)));
}

TEST_F(TransferTest, PutServerError) {
  net.reply(encode_ack(0), kPeer);
  net.reply(raw_error(3, "full"), kPeer);
  auto err = put_file("f", filled(2000, 1), net, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::DiskFull);
}

TEST_F(TransferTest, PutRejectsDataAsReply) {
  auto reply = encode_data(1, filled(3, 0));
  net.reply(reply, kPeer);
  auto err = put_file("f", filled(10, 1), net, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, reply);
}

TEST_F(TransferTest, PutRejectsTooLargeFile) {
  std::vector<uint8_t> data(65535 * kBlockSize);
  auto err = put_file("huge", data, net, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::FileTooLarge);
  EXPECT_TRUE(net.sent().empty());
}

TEST_F(TransferTest, PutLenientFinishesOnAnyAckAfterLastChunk) {
  auto data = filled(100, 1);
  net.reply(encode_ack(0), kPeer);
  net.reply(encode_ack(0), kPeer);

  WriteTransfer t(net, "f", data, opts);
  ASSERT_FALSE(t.run().has_value());
  EXPECT_EQ(t.data_packets_sent(), 1u);
}

TEST_F(TransferTest, PutStrictWaitsForFinalAck) {
  opts.strict_blocks = true;
  auto data = filled(100, 1);
  net.reply(encode_ack(0), kPeer);
  net.reply(encode_ack(0), kPeer); // duplicate, final chunk resent
  net.reply(encode_ack(1), kPeer);

  WriteTransfer t(net, "f", data, opts);
  ASSERT_FALSE(t.run().has_value());
  EXPECT_EQ(t.data_packets_sent(), 2u);
  EXPECT_EQ(net.pending(), 0u);
}

TEST_F(TransferTest, PutStrictRejectsFutureAck) {
  opts.strict_blocks = true;
  net.reply(encode_ack(0), kPeer);
  auto bad = encode_ack(7);
  net.reply(bad, kPeer);
  auto err = put_file("f", filled(1000, 1), net, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, bad);
}

TEST_F(TransferTest, PutRetransmitsDataOnTimeout) {
  opts.timeout = std::chrono::milliseconds(50);
  auto data = filled(10, 1);
  net.reply(encode_ack(0), kPeer);
  net.fail_next_receive(asio::error::timed_out);
  net.reply(encode_ack(1), kPeer);

  auto err = put_file("f", data, net, opts);
  ASSERT_FALSE(err.has_value());
  ASSERT_EQ(net.sent().size(), 3u);
  EXPECT_EQ(net.sent()[1].datagram, net.sent()[2].datagram);
  EXPECT_EQ(net.sent()[2].to, kPeer);
}

TEST_F(TransferTest, PutRejectsUnknownTid) {
  net.reply(encode_ack(0), kPeer);
  net.reply(encode_ack(1), kStranger);
  net.reply(encode_ack(1), kPeer);
  auto err = put_file("f", filled(10, 1), net, opts);
  ASSERT_FALSE(err.has_value());
  ASSERT_EQ(net.sent().size(), 3u);
  EXPECT_EQ(net.sent()[2].to, kStranger);
}

// Any first reply whose opcode is not 1..5 ends both directions with the
// datagram attached unchanged.
class BadOpcodeTest : public TransferTest,
                      public ::testing::WithParamInterface<uint16_t> {};

TEST_P(BadOpcodeTest, BothDirectionsReportInvalidResponse) {
  uint16_t op = GetParam();
  std::vector<uint8_t> bytes = {(uint8_t)(op >> 8), (uint8_t)op, 0, 1, 'z'};

  ScriptedTransport get_net;
  get_net.reply(bytes, kPeer);
  std::vector<uint8_t> out;
  auto err = get_file("f", get_net, out, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, bytes);

  ScriptedTransport put_net;
  put_net.reply(bytes, kPeer);
  err = put_file("f", filled(10, 0), put_net, opts);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->kind, TransferErrorKind::InvalidResponse);
  EXPECT_EQ(err->raw, bytes);
}

INSTANTIATE_TEST_SUITE_P(Opcodes, BadOpcodeTest,
                         ::testing::Values(0, 6, 7, 0x0100, 0xFFFF));

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>
#include <boost/test/unit_test.hpp>

#include "pxeexception.hh"
#include "tftpserver.hh"

namespace
{
//! Collects what the detached transfer threads report
class TransferRecorder
{
public:
  void log(const ComboAddress& peer, const string& path, const std::optional<string>& error)
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    d_logged.push_back({peer, path, error});
    d_cond.notify_all();
  }

  struct Entry
  {
    ComboAddress peer;
    string path;
    std::optional<string> error;
  };

  //! Waits for the n-th transfer to finish
  Entry waitFor(size_t count)
  {
    std::unique_lock<std::mutex> lock(d_mutex);
    BOOST_REQUIRE(d_cond.wait_for(lock, std::chrono::seconds(10), [this, count]() { return d_logged.size() >= count; }));
    return d_logged.at(count - 1);
  }

  size_t size()
  {
    std::lock_guard<std::mutex> lock(d_mutex);
    return d_logged.size();
  }

private:
  std::mutex d_mutex;
  std::condition_variable d_cond;
  std::vector<Entry> d_logged;
};

static string makeRequest(uint16_t opcode, const std::vector<string>& fields)
{
  string ret;
  ret.push_back(static_cast<char>(opcode >> 8));
  ret.push_back(static_cast<char>(opcode & 0xff));
  for (const auto& field : fields) {
    ret.append(field);
    ret.push_back('\0');
  }
  return ret;
}

static TFTPTransferSource makeSource(const string& content)
{
  TFTPTransferSource ret;
  ret.stream = std::make_unique<std::istringstream>(content);
  ret.size = content.size();
  return ret;
}

//! A TFTPServer on a random loopback port, served from its own thread
struct LoopbackServer
{
  LoopbackServer(size_t maxTransfers = TFTPServer::s_defaultMaxTransfers, std::chrono::milliseconds retransmitTimeout = std::chrono::milliseconds(300)) :
    recorder(std::make_shared<TransferRecorder>()),
    server(
      ComboAddress("127.0.0.1", 0), [](const string& path, const ComboAddress& /* peer */) {
        if (path != "aa:bb:cc:dd:ee:ff/7") {
          throw TFTPNotFound("unknown path \"" + path + "\"");
        }
        return makeSource("0123456789abcdefghij");
      },
      [recorder = recorder](const ComboAddress& peer, const string& path, const std::optional<string>& error) { recorder->log(peer, path, error); }, timeval{0, 100000}, maxTransfers, retransmitTimeout),
    client(AF_INET, SOCK_DGRAM, 0)
  {
    client.bind(ComboAddress("127.0.0.1", 0), false);
    client.setReadTimeout({5, 0});
    runner = std::thread([this]() { server.serve(); });
  }

  ~LoopbackServer()
  {
    server.stop();
    if (runner.joinable()) {
      runner.join();
    }
  }

  string roundTrip(const string& packet, ComboAddress& from)
  {
    client.sendTo(packet, server.getLocal());
    string dgram;
    client.recvFrom(dgram, from);
    return dgram;
  }

  std::shared_ptr<TransferRecorder> recorder;
  TFTPServer server;
  Socket client;
  std::thread runner;
};
}

BOOST_AUTO_TEST_SUITE(test_tftpserver_cc)

BOOST_AUTO_TEST_CASE(test_parseTFTPRequest)
{
  auto request = parseTFTPRequest(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "OCTET", "BlkSize", "1468", "tsize", "0"}));
  BOOST_CHECK_EQUAL(request.opcode, TFTP_OPCODE_RRQ);
  BOOST_CHECK_EQUAL(request.filename, "aa:bb:cc:dd:ee:ff/7");
  BOOST_CHECK_EQUAL(request.mode, "octet");
  BOOST_REQUIRE_EQUAL(request.options.size(), 2U);
  BOOST_CHECK_EQUAL(request.options.at("blksize"), "1468");
  BOOST_CHECK_EQUAL(request.options.at("tsize"), "0");

  request = parseTFTPRequest(makeRequest(TFTP_OPCODE_WRQ, {"upload", "netascii"}));
  BOOST_CHECK_EQUAL(request.opcode, TFTP_OPCODE_WRQ);
  BOOST_CHECK(request.options.empty());

  BOOST_CHECK_THROW(parseTFTPRequest(string("\x00\x01", 2)), TFTPProtocolError);
  BOOST_CHECK_THROW(parseTFTPRequest(makeRequest(TFTP_OPCODE_DATA, {"file", "octet"})), TFTPProtocolError);
  BOOST_CHECK_THROW(parseTFTPRequest(makeRequest(TFTP_OPCODE_RRQ, {"file"})), TFTPProtocolError);
  BOOST_CHECK_THROW(parseTFTPRequest(makeRequest(TFTP_OPCODE_RRQ, {"", "octet"})), TFTPProtocolError);
  BOOST_CHECK_THROW(parseTFTPRequest(makeRequest(TFTP_OPCODE_RRQ, {"file", "octet", "blksize"})), TFTPProtocolError);

  auto unterminated = makeRequest(TFTP_OPCODE_RRQ, {"file", "octet"});
  unterminated.pop_back();
  BOOST_CHECK_THROW(parseTFTPRequest(unterminated), TFTPProtocolError);
}

BOOST_AUTO_TEST_CASE(test_negotiation)
{
  TFTPRequest request;
  auto negotiation = negotiateTFTPOptions(request, 1000);
  BOOST_CHECK_EQUAL(negotiation.blksize, TFTP_DEFAULT_BLKSIZE);
  BOOST_CHECK(negotiation.acknowledged.empty());

  request.options["blksize"] = "1468";
  request.options["tsize"] = "0";
  request.options["windowsize"] = "4";
  negotiation = negotiateTFTPOptions(request, 1000);
  BOOST_CHECK_EQUAL(negotiation.blksize, 1468);
  BOOST_REQUIRE_EQUAL(negotiation.acknowledged.size(), 2U);
  BOOST_CHECK_EQUAL(negotiation.acknowledged.at("blksize"), "1468");
  BOOST_CHECK_EQUAL(negotiation.acknowledged.at("tsize"), "1000");

  const std::vector<std::pair<string, std::optional<uint16_t>>> tests = {
    {"8", 8},
    {"65464", 65464},
    {"65465", 65464},
    {"100000000", 65464},
    {"000512", 512},
    {"00000000000008", 8},
    {"0065465", 65464},
    {"000", std::nullopt},
    {"7", std::nullopt},
    {"0", std::nullopt},
    {"-1", std::nullopt},
    {"big", std::nullopt},
    {"", std::nullopt},
  };
  for (const auto& test : tests) {
    TFTPRequest blksizeRequest;
    blksizeRequest.options["blksize"] = test.first;
    negotiation = negotiateTFTPOptions(blksizeRequest, 0);
    if (test.second) {
      BOOST_CHECK_EQUAL(negotiation.blksize, *test.second);
      BOOST_CHECK_EQUAL(negotiation.acknowledged.at("blksize"), std::to_string(*test.second));
    }
    else {
      BOOST_CHECK_MESSAGE(negotiation.blksize == TFTP_DEFAULT_BLKSIZE, "blksize '" << test.first << "'");
      BOOST_CHECK(negotiation.acknowledged.empty());
    }
  }
}

BOOST_AUTO_TEST_CASE(test_packet_builders)
{
  BOOST_CHECK(makeTFTPData(1, "abc") == string("\x00\x03\x00\x01" "abc", 7));
  BOOST_CHECK(makeTFTPData(0x1234, "") == string("\x00\x03\x12\x34", 4));
  BOOST_CHECK(makeTFTPAck(0xffff) == string("\x00\x04\xff\xff", 4));
  BOOST_CHECK(makeTFTPError(TFTP_ERROR_NOT_FOUND, "nope") == string("\x00\x05\x00\x01" "nope\x00", 9));
  BOOST_CHECK(makeTFTPOptionAck({{"tsize", "20"}, {"blksize", "8"}}) == string("\x00\x06" "blksize\x00" "8\x00" "tsize\x00" "20\x00", 21));
}

BOOST_AUTO_TEST_CASE(test_transfer_with_options)
{
  LoopbackServer loop;
  ComboAddress from;

  auto reply = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet", "blksize", "8", "tsize", "0"}), from);
  BOOST_CHECK(reply == string("\x00\x06" "blksize\x00" "8\x00" "tsize\x00" "20\x00", 21));
  // transfers run from their own port
  BOOST_CHECK_NE(from.getPort(), loop.server.getLocal().getPort());

  const ComboAddress transferPeer(from);
  string data;
  for (uint16_t block = 0; block < 3; block++) {
    loop.client.sendTo(makeTFTPAck(block), transferPeer);
    string dgram;
    loop.client.recvFrom(dgram, from);
    BOOST_REQUIRE_GE(dgram.size(), 4U);
    BOOST_CHECK(dgram.substr(0, 4) == makeTFTPData(block + 1, "").substr(0, 4));
    data += dgram.substr(4);
  }
  BOOST_CHECK_EQUAL(data, "0123456789abcdefghij");
  loop.client.sendTo(makeTFTPAck(3), transferPeer);

  auto logged = loop.recorder->waitFor(1);
  BOOST_CHECK_EQUAL(logged.path, "aa:bb:cc:dd:ee:ff/7");
  BOOST_CHECK(!logged.error);
  BOOST_CHECK_EQUAL(logged.peer, loop.client.getLocal());
}

BOOST_AUTO_TEST_CASE(test_transfer_retransmits)
{
  LoopbackServer loop;
  ComboAddress from;

  auto first = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), from);
  BOOST_CHECK(first == makeTFTPData(1, "0123456789abcdefghij"));

  // no ACK, the block comes again
  string again;
  loop.client.recvFrom(again, from);
  BOOST_CHECK(again == first);

  loop.client.sendTo(makeTFTPAck(1), from);
  auto logged = loop.recorder->waitFor(1);
  BOOST_CHECK(!logged.error);
}

BOOST_AUTO_TEST_CASE(test_transfer_errors)
{
  LoopbackServer loop;
  ComboAddress from;

  auto reply = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"not-a-path", "octet"}), from);
  BOOST_CHECK(reply == makeTFTPError(TFTP_ERROR_NOT_FOUND, "unknown path \"not-a-path\""));
  auto logged = loop.recorder->waitFor(1);
  BOOST_REQUIRE(logged.error);
  BOOST_CHECK_EQUAL(*logged.error, "unknown path \"not-a-path\"");

  reply = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "netascii"}), from);
  BOOST_CHECK(reply == makeTFTPError(TFTP_ERROR_UNDEFINED, "only octet mode is supported"));
  BOOST_CHECK(loop.recorder->waitFor(2).error);

  reply = loop.roundTrip(makeRequest(TFTP_OPCODE_WRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), from);
  BOOST_CHECK(reply == makeTFTPError(TFTP_ERROR_ACCESS, "write requests are not supported"));
  BOOST_CHECK_EQUAL(from, loop.server.getLocal());

  reply = loop.roundTrip(makeTFTPAck(1), from);
  BOOST_REQUIRE_GE(reply.size(), 4U);
  BOOST_CHECK(reply.substr(0, 4) == string("\x00\x05\x00\x04", 4));
}

BOOST_AUTO_TEST_CASE(test_stale_acks_do_not_stall_a_transfer)
{
  LoopbackServer loop;
  ComboAddress from;

  auto first = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), from);
  BOOST_REQUIRE(first == makeTFTPData(1, "0123456789abcdefghij"));
  const ComboAddress transferPeer(from);

  // keep acknowledging a block that is long gone, faster than the retransmit timeout
  loop.client.setReadTimeout({0, 50000});
  int retransmissions = 0;
  const auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (loop.recorder->size() == 0 && std::chrono::steady_clock::now() < giveUp) {
    loop.client.sendTo(makeTFTPAck(0), transferPeer);
    try {
      string dgram;
      loop.client.recvFrom(dgram, from);
      if (dgram == first) {
        retransmissions++;
      }
    }
    catch (const TimeoutException&) {
    }
  }

  BOOST_CHECK_EQUAL(retransmissions, TFTPServer::s_retries);
  auto logged = loop.recorder->waitFor(1);
  BOOST_REQUIRE(logged.error);
  BOOST_CHECK_EQUAL(*logged.error, "timeout waiting for ACK of block 1");
}

BOOST_AUTO_TEST_CASE(test_transfer_limit)
{
  LoopbackServer loop(1, std::chrono::seconds(5));
  ComboAddress from;

  auto first = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), from);
  BOOST_REQUIRE(first == makeTFTPData(1, "0123456789abcdefghij"));
  const ComboAddress transferPeer(from);

  // the only slot is taken
  Socket other(AF_INET, SOCK_DGRAM, 0);
  other.bind(ComboAddress("127.0.0.1", 0), false);
  other.setReadTimeout({5, 0});
  other.sendTo(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), loop.server.getLocal());
  string refused;
  ComboAddress refusedFrom;
  other.recvFrom(refused, refusedFrom);
  BOOST_CHECK(refused == makeTFTPError(TFTP_ERROR_UNDEFINED, "too many transfers, try again later"));
  BOOST_CHECK_EQUAL(refusedFrom, loop.server.getLocal());
  auto logged = loop.recorder->waitFor(1);
  BOOST_CHECK_EQUAL(logged.peer, other.getLocal());
  BOOST_REQUIRE(logged.error);
  BOOST_CHECK_EQUAL(*logged.error, "too many concurrent transfers");

  loop.client.sendTo(makeTFTPAck(1), transferPeer);
  BOOST_CHECK(!loop.recorder->waitFor(2).error);

  // the slot is given back right after the transfer is reported
  string again;
  for (int attempt = 0; attempt < 20 && again != first; attempt++) {
    if (attempt > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    again = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), from);
  }
  BOOST_REQUIRE(again == first);
  auto reported = loop.recorder->size();
  loop.client.sendTo(makeTFTPAck(1), from);
  BOOST_CHECK(!loop.recorder->waitFor(reported + 1).error);
}

BOOST_AUTO_TEST_CASE(test_serve_waits_for_transfers)
{
  LoopbackServer loop(TFTPServer::s_defaultMaxTransfers, std::chrono::seconds(5));
  ComboAddress from;

  auto first = loop.roundTrip(makeRequest(TFTP_OPCODE_RRQ, {"aa:bb:cc:dd:ee:ff/7", "octet"}), from);
  BOOST_REQUIRE(first == makeTFTPData(1, "0123456789abcdefghij"));

  // never acknowledged, stopping ends it well before the retransmit timeout
  const auto before = std::chrono::steady_clock::now();
  loop.server.stop();
  loop.runner.join();
  BOOST_CHECK(std::chrono::steady_clock::now() - before < std::chrono::seconds(3));

  BOOST_REQUIRE_EQUAL(loop.recorder->size(), 1U);
  auto logged = loop.recorder->waitFor(1);
  BOOST_REQUIRE(logged.error);
  BOOST_CHECK_EQUAL(*logged.error, "transfer aborted, server is shutting down");
}

BOOST_AUTO_TEST_SUITE_END()

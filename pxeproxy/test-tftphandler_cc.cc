#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <iterator>
#include <boost/test/unit_test.hpp>

#include "test-common.hh"
#include "tftphandler.hh"

static std::shared_ptr<const ImageMap> makeImages()
{
  auto images = std::make_shared<ImageMap>();
  (*images)[Firmware::X86PC] = "undionly.kpxe";
  (*images)[Firmware::EFI64] = string("ipxe.efi\0with a NUL", 19);
  (*images)[Firmware::EFIArm64] = "arm64 ipxe";
  return images;
}

static string slurp(std::istream& stream)
{
  return string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

BOOST_AUTO_TEST_SUITE(test_tftphandler_cc)

BOOST_AUTO_TEST_CASE(test_parseTFTPPath)
{
  auto parsed = parseTFTPPath("aa:bb:cc:dd:ee:ff/11");
  BOOST_CHECK_EQUAL(parsed.first.toString(), "aa:bb:cc:dd:ee:ff");
  BOOST_CHECK_EQUAL(parsed.second, 11);

  parsed = parseTFTPPath("AA-BB-CC-DD-EE-FF/0");
  BOOST_CHECK_EQUAL(parsed.first.toString(), "aa:bb:cc:dd:ee:ff");
  BOOST_CHECK_EQUAL(parsed.second, 0);

  for (const auto* bad : {"", "not-a-path", "aa:bb:cc:dd:ee:ff", "aa:bb:cc:dd:ee:ff/", "/7", "aa:bb:cc:dd:ee:ff//7", "aa:bb:cc:dd:ee:ff/7/1",
                          "aa:bb:cc:dd:ee/7", "aa:bb:cc:dd:ee:ff/x", "aa:bb:cc:dd:ee:ff/-7", "aa:bb:cc:dd:ee:ff/99999999999999999999"}) {
    BOOST_CHECK_THROW(parseTFTPPath(bad), TFTPNotFound);
  }
}

BOOST_AUTO_TEST_CASE(test_open)
{
  auto events = std::make_shared<RecordingEventSink>();
  TFTPImageDispatcher dispatcher(makeImages(), events);
  const ComboAddress peer("192.168.1.77", 2070);

  auto source = dispatcher.open("aa:bb:cc:dd:ee:ff/11", peer);
  BOOST_REQUIRE(source.stream != nullptr);
  BOOST_CHECK_EQUAL(source.size, 10U);
  BOOST_CHECK_EQUAL(slurp(*source.stream), "arm64 ipxe");

  source = dispatcher.open("aa:bb:cc:dd:ee:ff/7", peer);
  BOOST_CHECK_EQUAL(source.size, 19U);
  BOOST_CHECK(slurp(*source.stream) == string("ipxe.efi\0with a NUL", 19));

  // opening does not count as booting
  BOOST_CHECK(events->getEvents().empty());
}

BOOST_AUTO_TEST_CASE(test_open_failures)
{
  TFTPImageDispatcher dispatcher(makeImages(), std::make_shared<RecordingEventSink>());
  const ComboAddress peer("192.168.1.77", 2070);

  try {
    dispatcher.open("not-a-path", peer);
    BOOST_FAIL("bogus path should not open");
  }
  catch (const TFTPNotFound& e) {
    BOOST_CHECK_EQUAL(e.reason, "unknown path \"not-a-path\"");
  }

  try {
    dispatcher.open("aa:bb:cc:dd:ee:ff/999", peer);
    BOOST_FAIL("unknown firmware should not open");
  }
  catch (const UnknownFirmwareError& e) {
    BOOST_CHECK_EQUAL(e.reason, "unknown firmware type 999");
  }

  // a firmware we know but have no image for
  BOOST_CHECK_THROW(dispatcher.open("aa:bb:cc:dd:ee:ff/6", peer), UnknownFirmwareError);
}

BOOST_AUTO_TEST_CASE(test_logTransfer)
{
  auto events = std::make_shared<RecordingEventSink>();
  TFTPImageDispatcher dispatcher(makeImages(), events);
  const ComboAddress peer("192.168.1.77", 2070);

  dispatcher.logTransfer(peer, "aa:bb:cc:dd:ee:ff/7", std::nullopt);
  auto recorded = events->getEvents();
  BOOST_REQUIRE_EQUAL(recorded.size(), 1U);
  BOOST_CHECK_EQUAL(recorded.at(0).mac.toString(), "aa:bb:cc:dd:ee:ff");
  BOOST_CHECK(recorded.at(0).state == MachineState::TFTP);
  BOOST_CHECK_EQUAL(recorded.at(0).message, "Sent iPXE to 192.168.1.77:2070");

  dispatcher.logTransfer(peer, "not-a-path", std::nullopt);
  BOOST_CHECK_EQUAL(events->getEvents().size(), 1U);
  BOOST_CHECK(events->getFailures().empty());
}

BOOST_AUTO_TEST_CASE(test_logTransfer_failures)
{
  auto events = std::make_shared<RecordingEventSink>();
  TFTPImageDispatcher dispatcher(makeImages(), events);
  const ComboAddress peer("192.168.1.77", 2070);

  dispatcher.logTransfer(peer, "aa:bb:cc:dd:ee:ff/7", string("timeout waiting for ACK of block 3"));
  // no MAC to be had from this one, it still counts
  dispatcher.logTransfer(peer, "not-a-path", string("unknown path \"not-a-path\""));

  BOOST_CHECK(events->getEvents().empty());
  auto failures = events->getFailures();
  BOOST_REQUIRE_EQUAL(failures.size(), 2U);
  BOOST_CHECK_EQUAL(failures.at(0).peer, peer);
  BOOST_CHECK_EQUAL(failures.at(0).path, "aa:bb:cc:dd:ee:ff/7");
  BOOST_CHECK_EQUAL(failures.at(0).error, "timeout waiting for ACK of block 3");
  BOOST_CHECK_EQUAL(failures.at(1).path, "not-a-path");
  BOOST_CHECK_EQUAL(failures.at(1).error, "unknown path \"not-a-path\"");
}

BOOST_AUTO_TEST_SUITE_END()

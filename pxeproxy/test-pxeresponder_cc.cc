#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>

#include "pxeresponder.hh"
#include "test-common.hh"

namespace
{
struct PXEResponderFixture
{
  PXEResponderFixture() :
    events(std::make_shared<RecordingEventSink>())
  {
    auto fake = std::make_unique<FakeDHCPConn>();
    conn = fake.get();
    responder = std::make_unique<PXEResponder>(std::move(fake), events, [this](const NetworkInterface& itf) {
      if (noAddress) {
        throw NoAddressError("no usable unicast address configured on interface " + itf.name);
      }
      return ComboAddress("192.168.1.10");
    },
                                               timeval{0, 500000});
  }

  FakeDHCPConn* conn{nullptr};
  std::shared_ptr<RecordingEventSink> events;
  std::unique_ptr<PXEResponder> responder;
  bool noAddress{false};
};
}

BOOST_AUTO_TEST_SUITE(test_pxeresponder_cc)

BOOST_AUTO_TEST_CASE(test_validateRequest)
{
  BOOST_CHECK(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 6, DHCPMessageType::Request)) == Firmware::EFI32);
  BOOST_CHECK(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request)) == Firmware::EFI64);
  BOOST_CHECK(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 9, DHCPMessageType::Request)) == Firmware::EFIBC);
  BOOST_CHECK(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 11, DHCPMessageType::Request)) == Firmware::EFIArm64);

  // BIOS clients bypass boot server discovery, they never come here
  BOOST_CHECK_THROW(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 0, DHCPMessageType::Request)), ValidationError);
  BOOST_CHECK_THROW(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 16, DHCPMessageType::Request)), ValidationError);

  BOOST_CHECK_THROW(PXEResponder::validateRequest(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Discover)), NotApplicable);
  auto packet = makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request);
  packet.options.erase(DHCP_OPTION_CLIENT_ARCH);
  BOOST_CHECK_THROW(PXEResponder::validateRequest(packet), NotApplicable);

  packet = makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request);
  packet.options.set(DHCP_OPTION_CLIENT_GUID, makeGUID(3));
  BOOST_CHECK_THROW(PXEResponder::validateRequest(packet), ValidationError);
}

BOOST_AUTO_TEST_CASE(test_buildAck)
{
  auto request = makeBootRequest("00:11:22:33:44:55", 9, DHCPMessageType::Request);
  request.ciaddr = ComboAddress("192.168.1.77");
  request.options.set(DHCP_OPTION_CLIENT_GUID, makeGUID(0));

  auto ack = PXEResponder::buildAck(request, ComboAddress("192.168.1.10"), Firmware::EFIBC);
  BOOST_CHECK(ack.type == DHCPMessageType::Ack);
  BOOST_CHECK_EQUAL(ack.xid, request.xid);
  BOOST_CHECK_EQUAL(ack.chaddr, request.chaddr);
  BOOST_CHECK_EQUAL(ack.ciaddr.toString(), "192.168.1.77");
  BOOST_CHECK_EQUAL(ack.siaddr.toString(), "192.168.1.10");
  BOOST_CHECK_EQUAL(ack.sname, "192.168.1.10");
  BOOST_CHECK_EQUAL(ack.file, "00:11:22:33:44:55/9");
  BOOST_CHECK_EQUAL(ack.options.getIP(DHCP_OPTION_SERVER).toString(), "192.168.1.10");
  BOOST_CHECK_EQUAL(ack.options.getString(DHCP_OPTION_CLASS_IDENTIFIER), "PXEClient");
  BOOST_CHECK(ack.options.getBytes(DHCP_OPTION_CLIENT_GUID) == makeGUID(0));
  BOOST_CHECK(!ack.options.has(DHCP_OPTION_VENDOR_SPECIFIC));
}

BOOST_FIXTURE_TEST_CASE(test_ack_goes_back_to_sender, PXEResponderFixture)
{
  BOOST_CHECK_EQUAL(conn->d_readTimeout.tv_usec, 500000);

  conn->queue(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request), makeInterface(3, "eth1"), ComboAddress("192.168.1.77", 68));
  BOOST_CHECK(responder->handleOne() == LoopOutcome::Continue);

  BOOST_REQUIRE_EQUAL(conn->d_sent.size(), 1U);
  const auto& sent = conn->d_sent.at(0);
  BOOST_CHECK_EQUAL(sent.dest.toStringWithPort(), "192.168.1.77:68");
  BOOST_CHECK_EQUAL(sent.itf.name, "eth1");
  BOOST_CHECK(sent.packet.type == DHCPMessageType::Ack);
  BOOST_CHECK_EQUAL(sent.packet.file, "00:11:22:33:44:55/7");

  auto recorded = events->getEvents();
  BOOST_REQUIRE_EQUAL(recorded.size(), 1U);
  BOOST_CHECK(recorded.at(0).state == MachineState::PXE);
  BOOST_CHECK_EQUAL(recorded.at(0).message, "Sent PXE configuration");
}

BOOST_FIXTURE_TEST_CASE(test_dropped_packets, PXEResponderFixture)
{
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Discover), makeInterface());
  conn->queue(makeBootRequest("00:11:22:33:44:55", 0, DHCPMessageType::Request), makeInterface());
  BOOST_CHECK(responder->handleOne() == LoopOutcome::Continue);
  BOOST_CHECK(responder->handleOne() == LoopOutcome::Continue);

  noAddress = true;
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request), makeInterface());
  BOOST_CHECK(responder->handleOne() == LoopOutcome::Continue);

  BOOST_CHECK(conn->d_sent.empty());
  BOOST_CHECK(events->getEvents().empty());
}

BOOST_FIXTURE_TEST_CASE(test_send_fails, PXEResponderFixture)
{
  conn->d_failSend = true;
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request), makeInterface());
  BOOST_CHECK(responder->handleOne() == LoopOutcome::Continue);
  BOOST_CHECK_EQUAL(events->getEvents().size(), 1U);
}

BOOST_FIXTURE_TEST_CASE(test_receive_fails, PXEResponderFixture)
{
  conn->d_failReceive = true;
  BOOST_CHECK(responder->handleOne() == LoopOutcome::Fatal);
  BOOST_CHECK_THROW(responder->serve(), NetworkError);
  BOOST_CHECK(conn->d_closed);
}

BOOST_FIXTURE_TEST_CASE(test_stop, PXEResponderFixture)
{
  responder->stop();
  responder->serve();
  BOOST_CHECK(conn->d_closed);
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <thread>
#include <boost/test/unit_test.hpp>

#include "proxydhcp.hh"
#include "test-common.hh"

namespace
{
struct ProxyDHCPFixture
{
  ProxyDHCPFixture() :
    policy(std::make_shared<FakeBootPolicy>()), events(std::make_shared<RecordingEventSink>())
  {
    auto fake = std::make_unique<FakeDHCPConn>();
    conn = fake.get();
    server = std::make_unique<ProxyDHCPServer>(std::move(fake), policy, events, [this](const NetworkInterface& itf) {
      resolved.push_back(itf.name);
      if (noAddress) {
        throw NoAddressError("no usable unicast address configured on interface " + itf.name);
      }
      return ComboAddress("192.168.1.10");
    },
                                               8080);
  }

  FakeDHCPConn* conn{nullptr};
  std::shared_ptr<FakeBootPolicy> policy;
  std::shared_ptr<RecordingEventSink> events;
  std::unique_ptr<ProxyDHCPServer> server;
  std::vector<string> resolved;
  bool noAddress{false};
};
}

static Firmware classify(const DHCPPacket& packet)
{
  return ProxyDHCPServer::classifyClient(packet).second;
}

BOOST_AUTO_TEST_SUITE(test_proxydhcp_cc)

BOOST_AUTO_TEST_CASE(test_isBootRequest)
{
  BOOST_CHECK_NO_THROW(ProxyDHCPServer::isBootRequest(makeBootRequest("00:11:22:33:44:55", 7)));
  BOOST_CHECK_THROW(ProxyDHCPServer::isBootRequest(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request)), NotApplicable);

  auto packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.erase(DHCP_OPTION_CLIENT_ARCH);
  BOOST_CHECK_THROW(ProxyDHCPServer::isBootRequest(packet), NotApplicable);
}

BOOST_AUTO_TEST_CASE(test_classify_architectures)
{
  const std::vector<std::tuple<uint16_t, Architecture, Firmware>> tests = {
    {0, Architecture::IA32, Firmware::X86PC},
    {6, Architecture::IA32, Firmware::EFI32},
    {7, Architecture::X64, Firmware::EFI64},
    {9, Architecture::X64, Firmware::EFIBC},
    {11, Architecture::ARM64, Firmware::EFIArm64},
  };

  for (const auto& test : tests) {
    auto result = ProxyDHCPServer::classifyClient(makeBootRequest("00:11:22:33:44:55", std::get<0>(test)));
    BOOST_CHECK_EQUAL(result.first.mac.toString(), "00:11:22:33:44:55");
    BOOST_CHECK_MESSAGE(result.first.arch == std::get<1>(test), "architecture for code " << std::get<0>(test));
    BOOST_CHECK_MESSAGE(result.second == std::get<2>(test), "firmware for code " << std::get<0>(test));
  }

  for (uint16_t code : {1, 2, 16, 19, 999}) {
    BOOST_CHECK_THROW(ProxyDHCPServer::classifyClient(makeBootRequest("00:11:22:33:44:55", code)), ValidationError);
  }

  try {
    ProxyDHCPServer::classifyClient(makeBootRequest("00:11:22:33:44:55", 16));
    BOOST_FAIL("http4 boot should have been refused");
  }
  catch (const ValidationError& e) {
    BOOST_CHECK_EQUAL(e.reason, "unsupported client firmware type (probably http4 x64 efi boot)");
  }

  try {
    ProxyDHCPServer::classifyClient(makeBootRequest("00:11:22:33:44:55", 999));
    BOOST_FAIL("unknown architecture should have been refused");
  }
  catch (const ValidationError& e) {
    BOOST_CHECK_EQUAL(e.reason, "unsupported client firmware type '999'");
  }
}

BOOST_AUTO_TEST_CASE(test_classify_malformed_architecture)
{
  auto packet = makeBootRequest("00:11:22:33:44:55", 0);
  packet.options.erase(DHCP_OPTION_CLIENT_ARCH);
  packet.options.set(DHCP_OPTION_CLIENT_ARCH, string(1, '\x07'));

  try {
    ProxyDHCPServer::classifyClient(packet);
    BOOST_FAIL("one byte option 93 should have been refused");
  }
  catch (const ValidationError& e) {
    BOOST_CHECK_EQUAL(e.reason.find("malformed DHCP option 93 (required for PXE): "), 0U);
  }
}

BOOST_AUTO_TEST_CASE(test_classify_raspberry_pi)
{
  BOOST_CHECK_THROW(ProxyDHCPServer::classifyClient(makeBootRequest("b8:27:eb:01:02:03", 0)), ValidationError);
  BOOST_CHECK_THROW(ProxyDHCPServer::classifyClient(makeBootRequest("dc:a6:32:01:02:03", 0)), ValidationError);
  // only BIOS claims are suspicious
  BOOST_CHECK(classify(makeBootRequest("b8:27:eb:01:02:03", 7)) == Firmware::EFI64);
  BOOST_CHECK(classify(makeBootRequest("b8:27:ec:01:02:03", 0)) == Firmware::X86PC);
}

BOOST_AUTO_TEST_CASE(test_classify_user_class)
{
  auto packet = makeBootRequest("00:11:22:33:44:55", 0);
  packet.options.set(DHCP_OPTION_USER_CLASS, "iPXE");
  BOOST_CHECK(classify(packet) == Firmware::X86iPXE);

  packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.set(DHCP_OPTION_USER_CLASS, "iPXE");
  BOOST_CHECK(classify(packet) == Firmware::EFI64);

  packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.set(DHCP_OPTION_USER_CLASS, "pixiecore");
  auto result = ProxyDHCPServer::classifyClient(packet);
  BOOST_CHECK(result.second == Firmware::PixiecoreiPXE);
  BOOST_CHECK(result.first.arch == Architecture::X64);

  packet = makeBootRequest("00:11:22:33:44:55", 0);
  packet.options.set(DHCP_OPTION_USER_CLASS, "something else");
  BOOST_CHECK(classify(packet) == Firmware::X86PC);
}

BOOST_AUTO_TEST_CASE(test_classify_guid)
{
  auto packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.set(DHCP_OPTION_CLIENT_GUID, makeGUID(0));
  BOOST_CHECK_NO_THROW(ProxyDHCPServer::classifyClient(packet));

  packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.set(DHCP_OPTION_CLIENT_GUID, "");
  BOOST_CHECK_NO_THROW(ProxyDHCPServer::classifyClient(packet));

  packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.set(DHCP_OPTION_CLIENT_GUID, makeGUID(1));
  BOOST_CHECK_THROW(ProxyDHCPServer::classifyClient(packet), ValidationError);

  packet = makeBootRequest("00:11:22:33:44:55", 7);
  packet.options.set(DHCP_OPTION_CLIENT_GUID, string(16, '\0'));
  BOOST_CHECK_THROW(ProxyDHCPServer::classifyClient(packet), ValidationError);
}

BOOST_FIXTURE_TEST_CASE(test_buildOffer_bios, ProxyDHCPFixture)
{
  auto request = makeBootRequest("de:ad:be:ef:00:01", 0);
  request.options.set(DHCP_OPTION_CLIENT_GUID, makeGUID(0));
  Machine machine{request.chaddr, Architecture::IA32};

  auto offer = server->buildOffer(request, machine, ComboAddress("10.0.0.1"), Firmware::X86PC);
  BOOST_CHECK(offer.type == DHCPMessageType::Offer);
  BOOST_CHECK_EQUAL(offer.xid, 0x12345678U);
  BOOST_CHECK(offer.broadcast);
  BOOST_CHECK_EQUAL(offer.chaddr, request.chaddr);
  BOOST_CHECK_EQUAL(offer.siaddr.toString(), "10.0.0.1");
  BOOST_CHECK(offer.yiaddr.isUnspecified());
  BOOST_CHECK_EQUAL(offer.sname, "10.0.0.1");
  BOOST_CHECK_EQUAL(offer.file, "de:ad:be:ef:00:01/0");
  BOOST_CHECK_EQUAL(offer.options.getIP(DHCP_OPTION_SERVER).toString(), "10.0.0.1");
  BOOST_CHECK_EQUAL(offer.options.getString(DHCP_OPTION_CLASS_IDENTIFIER), "PXEClient");
  BOOST_CHECK(offer.options.getBytes(DHCP_OPTION_VENDOR_SPECIFIC) == string("\x06\x01\x08\xff", 4));
  BOOST_CHECK(offer.options.getBytes(DHCP_OPTION_CLIENT_GUID) == makeGUID(0));
}

BOOST_FIXTURE_TEST_CASE(test_buildOffer_variants, ProxyDHCPFixture)
{
  auto request = makeBootRequest("de:ad:be:ef:00:01", 0);
  Machine machine{request.chaddr, Architecture::IA32};
  const ComboAddress server4("10.0.0.1");

  auto offer = server->buildOffer(request, machine, server4, Firmware::X86iPXE);
  BOOST_CHECK_EQUAL(offer.file, "tftp://10.0.0.1/de:ad:be:ef:00:01/1");
  BOOST_CHECK(offer.sname.empty());
  BOOST_CHECK(offer.options.getBytes(DHCP_OPTION_VENDOR_SPECIFIC) == string("\x06\x01\x08\xff", 4));
  BOOST_CHECK(!offer.options.has(DHCP_OPTION_CLIENT_GUID));

  for (auto firmware : {Firmware::EFI32, Firmware::EFI64, Firmware::EFIBC, Firmware::EFIArm64}) {
    offer = server->buildOffer(request, machine, server4, firmware);
    BOOST_CHECK_EQUAL(offer.sname, "10.0.0.1");
    BOOST_CHECK_EQUAL(offer.file, "de:ad:be:ef:00:01/" + std::to_string(getFirmwareCode(firmware)));
    BOOST_CHECK(!offer.options.has(DHCP_OPTION_VENDOR_SPECIFIC));
  }

  machine.arch = Architecture::X64;
  offer = server->buildOffer(request, machine, server4, Firmware::PixiecoreiPXE);
  BOOST_CHECK_EQUAL(offer.file, "http://10.0.0.1:8080/_/ipxe?arch=1&mac=de:ad:be:ef:00:01");
  BOOST_CHECK(offer.sname.empty());
  BOOST_CHECK(!offer.options.has(DHCP_OPTION_VENDOR_SPECIFIC));

  BOOST_CHECK_THROW(server->buildOffer(request, machine, server4, static_cast<Firmware>(42)), DHCPEncodeError);
}

BOOST_FIXTURE_TEST_CASE(test_offer_end_to_end, ProxyDHCPFixture)
{
  BOOST_CHECK_EQUAL(conn->d_readTimeout.tv_sec, 1);

  conn->queue(makeBootRequest("00:11:22:33:44:55", 7), makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_REQUIRE_EQUAL(conn->d_sent.size(), 1U);
  const auto& sent = conn->d_sent.at(0);
  BOOST_CHECK_EQUAL(sent.dest.toStringWithPort(), "255.255.255.255:68");
  BOOST_CHECK_EQUAL(sent.itf.index, 2U);
  BOOST_CHECK(sent.packet.type == DHCPMessageType::Offer);
  BOOST_CHECK_EQUAL(sent.packet.xid, 0x12345678U);
  BOOST_CHECK_EQUAL(sent.packet.file, "00:11:22:33:44:55/7");
  BOOST_CHECK_EQUAL(sent.packet.sname, "192.168.1.10");
  BOOST_CHECK_EQUAL(sent.packet.siaddr.toString(), "192.168.1.10");

  BOOST_REQUIRE_EQUAL(policy->d_asked.size(), 1U);
  BOOST_CHECK(policy->d_asked.at(0).arch == Architecture::X64);
  BOOST_REQUIRE_EQUAL(resolved.size(), 1U);
  BOOST_CHECK_EQUAL(resolved.at(0), "eth0");

  auto recorded = events->getEvents();
  BOOST_REQUIRE_EQUAL(recorded.size(), 1U);
  BOOST_CHECK(recorded.at(0).state == MachineState::ProxyDHCP);
  BOOST_CHECK_EQUAL(recorded.at(0).mac.toString(), "00:11:22:33:44:55");
}

BOOST_FIXTURE_TEST_CASE(test_offer_pixiecore_event, ProxyDHCPFixture)
{
  auto request = makeBootRequest("00:11:22:33:44:55", 7);
  request.options.set(DHCP_OPTION_USER_CLASS, "pixiecore");
  conn->queue(request, makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_REQUIRE_EQUAL(conn->d_sent.size(), 1U);
  BOOST_CHECK_EQUAL(conn->d_sent.at(0).packet.file, "http://192.168.1.10:8080/_/ipxe?arch=1&mac=00:11:22:33:44:55");
  auto recorded = events->getEvents();
  BOOST_REQUIRE_EQUAL(recorded.size(), 1U);
  BOOST_CHECK(recorded.at(0).state == MachineState::ProxyDHCPiPXE);
}

BOOST_FIXTURE_TEST_CASE(test_offer_through_relay, ProxyDHCPFixture)
{
  auto request = makeBootRequest("00:11:22:33:44:55", 0);
  request.giaddr = ComboAddress("10.1.2.1");
  conn->queue(request, makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_REQUIRE_EQUAL(conn->d_sent.size(), 1U);
  BOOST_CHECK_EQUAL(conn->d_sent.at(0).dest.toStringWithPort(), "10.1.2.1:67");
  BOOST_CHECK_EQUAL(conn->d_sent.at(0).packet.giaddr.toString(), "10.1.2.1");
}

BOOST_FIXTURE_TEST_CASE(test_dropped_packets, ProxyDHCPFixture)
{
  // not a boot request
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7, DHCPMessageType::Request), makeInterface());
  // unsupported architecture
  conn->queue(makeBootRequest("00:11:22:33:44:55", 16), makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_CHECK(conn->d_sent.empty());
  BOOST_CHECK(policy->d_asked.empty());
  BOOST_CHECK(events->getEvents().empty());
}

BOOST_FIXTURE_TEST_CASE(test_policy_says_no, ProxyDHCPFixture)
{
  policy->d_boot = false;
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7), makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_CHECK(conn->d_sent.empty());
  BOOST_CHECK(resolved.empty());
  auto recorded = events->getEvents();
  BOOST_REQUIRE_EQUAL(recorded.size(), 1U);
  BOOST_CHECK(recorded.at(0).state == MachineState::Ignored);
  BOOST_CHECK_EQUAL(recorded.at(0).message, "Machine should not netboot");
}

BOOST_FIXTURE_TEST_CASE(test_policy_fails, ProxyDHCPFixture)
{
  policy->d_fail = true;
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7), makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_CHECK(conn->d_sent.empty());
  BOOST_CHECK(events->getEvents().empty());
}

BOOST_FIXTURE_TEST_CASE(test_no_interface_address, ProxyDHCPFixture)
{
  noAddress = true;
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7), makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  BOOST_CHECK(conn->d_sent.empty());
  // the event goes out before we know whether we can answer
  BOOST_CHECK_EQUAL(events->getEvents().size(), 1U);
}

BOOST_FIXTURE_TEST_CASE(test_send_fails, ProxyDHCPFixture)
{
  conn->d_failSend = true;
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7), makeInterface());
  conn->queue(makeBootRequest("00:11:22:33:44:66", 7), makeInterface());
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);
  BOOST_CHECK_EQUAL(policy->d_asked.size(), 2U);
}

BOOST_FIXTURE_TEST_CASE(test_receive_fails, ProxyDHCPFixture)
{
  BOOST_CHECK(server->handleOne() == LoopOutcome::Continue);

  conn->d_failReceive = true;
  BOOST_CHECK(server->handleOne() == LoopOutcome::Fatal);
  BOOST_CHECK_THROW(server->serve(), NetworkError);
  BOOST_CHECK(conn->d_closed);
}

BOOST_FIXTURE_TEST_CASE(test_stop, ProxyDHCPFixture)
{
  conn->queue(makeBootRequest("00:11:22:33:44:55", 7), makeInterface());
  std::thread runner([this]() { server->serve(); });
  while (events->getEvents().empty()) {
    std::this_thread::yield();
  }
  server->stop();
  runner.join();
  BOOST_CHECK(conn->d_closed);
  BOOST_CHECK_EQUAL(conn->d_sent.size(), 1U);
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>
#include "iputils.hh"

using namespace boost;

BOOST_AUTO_TEST_SUITE(test_iputils_hh)

BOOST_AUTO_TEST_CASE(test_ComboAddress)
{
  ComboAddress local("127.0.0.1", 67);
  BOOST_CHECK(local == local);
  BOOST_CHECK_EQUAL(local.sin4.sin_family, AF_INET);
  BOOST_CHECK_EQUAL(local.sin4.sin_port, htons(67));
  BOOST_CHECK_EQUAL(local.sin4.sin_addr.s_addr, htonl(0x7f000001UL));

  ComboAddress withport("10.0.0.1:4011");
  BOOST_CHECK_EQUAL(withport.getPort(), 4011);

  ComboAddress withportO("10.0.0.1:4011", 67);
  BOOST_CHECK_EQUAL(withportO.getPort(), 4011);

  ComboAddress defaultport("10.0.0.1");
  BOOST_CHECK_EQUAL(defaultport.getPort(), 0);
  defaultport.setPort(68);
  BOOST_CHECK_EQUAL(defaultport.toStringWithPort(), "10.0.0.1:68");

  ComboAddress six("::1", 69);
  BOOST_CHECK(six.isIPv6());
  BOOST_CHECK_EQUAL(six.getPort(), 69);
  BOOST_CHECK_EQUAL(six.toStringWithPort(), "[::1]:69");
  // IPv6 is only ever a plain address, from an interface list
  BOOST_CHECK_THROW(ComboAddress("[::1]:69"), PXEProxyException);

  ComboAddress a = ComboAddress();
  ComboAddress b = ComboAddress();
  BOOST_CHECK(a == b);
  BOOST_CHECK(a.isUnspecified());

  ComboAddress c("10.0.0.1:67");
  ComboAddress d("10.0.0.1:68");
  ComboAddress e("10.0.0.2:67");
  BOOST_CHECK(a != c);
  BOOST_CHECK(c != d);
  BOOST_CHECK(c != e);
  BOOST_CHECK(c < d);

  BOOST_CHECK_THROW(ComboAddress("not an address"), PXEProxyException);
  BOOST_CHECK_THROW(ComboAddress("10.0.0.1:70000"), PXEProxyException);
}

BOOST_AUTO_TEST_CASE(test_ComboAddress_wire_bytes)
{
  const uint8_t raw[] = {192, 168, 1, 20};
  auto addr = ComboAddress::fromIPv4Bytes(raw, 68);
  BOOST_CHECK_EQUAL(addr.toString(), "192.168.1.20");
  BOOST_CHECK_EQUAL(addr.getPort(), 68);
  BOOST_CHECK(addr.toByteString() == string("\xc0\xa8\x01\x14", 4));
}

BOOST_AUTO_TEST_CASE(test_ComboAddress_classes)
{
  BOOST_CHECK(ComboAddress("0.0.0.0").isUnspecified());
  BOOST_CHECK(ComboAddress("::").isUnspecified());

  BOOST_CHECK(ComboAddress("127.0.0.1").isLoopback());
  BOOST_CHECK(ComboAddress("127.12.0.1").isLoopback());
  BOOST_CHECK(ComboAddress("::1").isLoopback());
  BOOST_CHECK(!ComboAddress("128.0.0.1").isLoopback());

  BOOST_CHECK(ComboAddress("169.254.3.4").isLinkLocal());
  BOOST_CHECK(ComboAddress("fe80::1").isLinkLocal());
  BOOST_CHECK(!ComboAddress("169.253.3.4").isLinkLocal());

  BOOST_CHECK(ComboAddress("224.0.0.1").isMulticast());
  BOOST_CHECK(ComboAddress("ff02::1").isMulticast());
  BOOST_CHECK(ComboAddress("255.255.255.255").isLimitedBroadcast());

  for (const auto* global : {"10.0.0.1", "192.168.1.1", "172.16.0.1", "8.8.8.8", "2001:db8::1"}) {
    BOOST_CHECK_MESSAGE(ComboAddress(global).isGlobalUnicast(), global);
  }
  for (const auto* notGlobal : {"0.0.0.0", "127.0.0.1", "169.254.1.1", "224.0.0.1", "255.255.255.255", "::1", "fe80::1"}) {
    BOOST_CHECK_MESSAGE(!ComboAddress(notGlobal).isGlobalUnicast(), notGlobal);
  }
}

BOOST_AUTO_TEST_CASE(test_getNetworkInterfaceByIndex)
{
  // there is no interface 0, ever
  BOOST_CHECK_THROW(getNetworkInterfaceByIndex(0), NetworkError);
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>

#include "macaddress.hh"
#include "pxeexception.hh"

BOOST_AUTO_TEST_SUITE(test_macaddress_cc)

BOOST_AUTO_TEST_CASE(test_parse_notations)
{
  const string expected("\x00\x11\x22\xaa\xbb\xcc", 6);

  BOOST_CHECK(MACAddress::parse("00:11:22:aa:bb:cc").getRaw() == expected);
  BOOST_CHECK(MACAddress::parse("00:11:22:AA:BB:CC").getRaw() == expected);
  BOOST_CHECK(MACAddress::parse("00-11-22-aa-bb-cc").getRaw() == expected);
  BOOST_CHECK(MACAddress::parse("0011.22aa.bbcc").getRaw() == expected);

  BOOST_CHECK_EQUAL(MACAddress::parse("02:00:5e:10:00:00:00:01").size(), 8U);
  BOOST_CHECK_EQUAL(MACAddress::parse("0200.5e10.0000.0001").size(), 8U);
  BOOST_CHECK_EQUAL(MACAddress::parse("00:00:00:00:fe:80:00:00:00:00:00:00:02:00:5e:10:00:00:00:01").size(), 20U);
}

BOOST_AUTO_TEST_CASE(test_parse_garbage)
{
  for (const auto* bad : {"", "not-a-mac", "00:11:22:aa:bb", "00:11:22:aa:bb:cc:dd", "00:11:22-aa:bb:cc", "00:11:22:aa:bb:cg", "0011.22aa.bbc", "00:11:22:aa:bb:cc:", "001122aabbcc"}) {
    BOOST_CHECK_THROW(MACAddress::parse(bad), PXEProxyException);
  }
}

BOOST_AUTO_TEST_CASE(test_toString)
{
  BOOST_CHECK_EQUAL(MACAddress::parse("DE-AD-BE-EF-00-01").toString(), "de:ad:be:ef:00:01");
  BOOST_CHECK_EQUAL(MACAddress(string("\x01\x02", 2)).toString(), "01:02");
  BOOST_CHECK_EQUAL(MACAddress().toString(), "");

  auto mac = MACAddress::parse("b8:27:eb:12:34:56");
  BOOST_CHECK(mac.hasPrefix("b8:27:eb:"));
  BOOST_CHECK(!mac.hasPrefix("dc:a6:32:"));
  BOOST_CHECK(mac == MACAddress::parse("B827.EB12.3456"));
}

BOOST_AUTO_TEST_SUITE_END()

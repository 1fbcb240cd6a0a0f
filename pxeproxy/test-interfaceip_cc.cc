#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>

#include "interfaceip.hh"
#include "pxeexception.hh"

static std::vector<ComboAddress> makeAddresses(const std::vector<string>& addresses)
{
  std::vector<ComboAddress> ret;
  for (const auto& addr : addresses) {
    ret.emplace_back(addr);
  }
  return ret;
}

BOOST_AUTO_TEST_SUITE(test_interfaceip_cc)

BOOST_AUTO_TEST_CASE(test_tiers)
{
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"127.0.0.1", "169.254.10.1", "192.168.1.10"})).toString(), "192.168.1.10");
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"192.168.1.10", "127.0.0.1", "169.254.10.1"})).toString(), "192.168.1.10");
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"127.0.0.1", "169.254.10.1"})).toString(), "169.254.10.1");
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"169.254.10.1"})).toString(), "169.254.10.1");
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"127.0.0.1"})).toString(), "127.0.0.1");

  // first match within a tier
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"10.0.0.1", "10.0.0.2"})).toString(), "10.0.0.1");
}

BOOST_AUTO_TEST_CASE(test_ipv4_only)
{
  BOOST_CHECK_EQUAL(pickInterfaceAddress(makeAddresses({"2001:db8::1", "fe80::1", "169.254.0.5"})).toString(), "169.254.0.5");
  BOOST_CHECK_THROW(pickInterfaceAddress(makeAddresses({"2001:db8::1", "fe80::1", "::1"})), NoAddressError);
}

BOOST_AUTO_TEST_CASE(test_nothing_usable)
{
  BOOST_CHECK_THROW(pickInterfaceAddress({}), NoAddressError);
  BOOST_CHECK_THROW(pickInterfaceAddress(makeAddresses({"0.0.0.0", "224.0.0.1"})), NoAddressError);
}

BOOST_AUTO_TEST_CASE(test_port_cleared)
{
  auto addr = pickInterfaceAddress({ComboAddress("10.0.0.1", 67)});
  BOOST_CHECK_EQUAL(addr.getPort(), 0);
}

BOOST_AUTO_TEST_CASE(test_resolve_unknown_interface)
{
  NetworkInterface itf;
  itf.index = 0;
  itf.name = "pxeproxy-none0";
  BOOST_CHECK_THROW(resolveInterfaceAddress(itf), NoAddressError);
}

BOOST_AUTO_TEST_SUITE_END()
